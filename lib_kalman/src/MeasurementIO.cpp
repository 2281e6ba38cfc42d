#include "MeasurementIO.hpp"
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <boost/algorithm/string/trim.hpp>
#include <boost/tokenizer.hpp>

EstimateRecorder::EstimateRecorder(const std::string &filename, const size_t measurementSize, const size_t stateSize)
    : filename_(filename), measurementSize_(measurementSize), stateSize_(stateSize)
{
  std::filesystem::path filePath = std::filesystem::path(filename);

  // Ensure the directory exists; create it if it doesn't.
  std::error_code ec;
  if (filePath.has_parent_path() && !std::filesystem::exists(filePath.parent_path(), ec))
  {
    std::filesystem::create_directories(filePath.parent_path(), ec);
    if (ec)
    {
      std::cerr << "Failed to create the directory: " << ec.message() << std::endl;
      return;
    }
  }

  // Open the CSV file and write headers
  file.open(filename, std::ios::out | std::ios::trunc);
  if (file.is_open())
  {
    file << "Step,Time";
    for (size_t i = 0UL; i < measurementSize_; ++i)
      file << ",Z_" << i;
    for (size_t i = 0UL; i < stateSize_; ++i)
      file << ",Xprior_" << i;
    for (size_t i = 0UL; i < stateSize_; ++i)
      file << ",Xpost_" << i;
    file << std::endl;
    start_time_ = std::chrono::high_resolution_clock::now(); // Record start time
  }
  else
  {
    std::cerr << "Error opening file to record: " << filename << std::endl;
  }
}

void EstimateRecorder::Record(const size_t step,
                              const blaze::DynamicVector<double> &measurement,
                              const blaze::DynamicVector<double> &prediction,
                              const blaze::DynamicVector<double> &estimate)
{
  if (!file.is_open())
  {
    return;
  }

  if (measurement.size() != measurementSize_ || prediction.size() != stateSize_ || estimate.size() != stateSize_)
  {
    throw std::invalid_argument("EstimateRecorder::Record: row does not match the header of " + filename_);
  }

  auto current_time = std::chrono::high_resolution_clock::now();
  double elapsed_seconds = std::chrono::duration<double>(current_time - start_time_).count();

  file << step << "," << elapsed_seconds;
  for (size_t i = 0UL; i < measurement.size(); ++i)
    file << "," << measurement[i];
  for (size_t i = 0UL; i < prediction.size(); ++i)
    file << "," << prediction[i];
  for (size_t i = 0UL; i < estimate.size(); ++i)
    file << "," << estimate[i];
  file << "\n";
}

void EstimateRecorder::Close()
{
  if (file.is_open())
  {
    file.close();
  }
}

bool Load_Measurements_From_CSV(const std::string &filepath, std::vector<blaze::DynamicVector<double>> *measurements)
{
  // Clear the output vector to start fresh
  measurements->clear();

  std::ifstream CSV_file(filepath, std::ifstream::in);
  if (!CSV_file.is_open())
  {
    std::cerr << "Failed to open file for reading: " << filepath << std::endl;
    return false;
  }

  typedef boost::tokenizer<boost::escaped_list_separator<char>> Tokenizer;

  std::string line;
  size_t lineNumber = 0UL, columns = 0UL;
  std::vector<double> row;

  while (std::getline(CSV_file, line))
  {
    ++lineNumber;
    if (!line.empty() && line.back() == '\r')
    {
      line.pop_back();
    }
    if (line.empty())
    {
      continue;
    }

    row.clear();
    bool parsed = true;
    try
    {
      Tokenizer tokenizer(line);
      for (Tokenizer::iterator it = tokenizer.begin(); it != tokenizer.end(); ++it)
      {
        const std::string token = boost::algorithm::trim_copy(*it);
        size_t consumed = 0UL;
        const double value = std::stod(token, &consumed);
        if (consumed != token.size())
        {
          throw std::invalid_argument(token);
        }
        row.push_back(value);
      }
    }
    catch (const std::invalid_argument &)
    {
      parsed = false;
    }
    catch (const std::out_of_range &)
    {
      parsed = false;
    }
    catch (const boost::escaped_list_error &)
    {
      parsed = false;
    }

    if (!parsed)
    {
      // the first line may hold the column names
      if (lineNumber == 1UL)
      {
        continue;
      }
      std::cerr << "Failed to parse line " << lineNumber << " of " << filepath << std::endl;
      measurements->clear();
      return false;
    }

    if (measurements->empty())
    {
      columns = row.size();
    }
    else if (row.size() != columns)
    {
      std::cerr << "Line " << lineNumber << " of " << filepath << " holds " << row.size() << " values, expected " << columns << std::endl;
      measurements->clear();
      return false;
    }

    blaze::DynamicVector<double> z(row.size());
    for (size_t i = 0UL; i < row.size(); ++i)
    {
      z[i] = row[i];
    }
    measurements->push_back(z);
  }

  CSV_file.close();

  return true;
}
