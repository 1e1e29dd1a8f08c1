//
// wrsample - Weighted Random Sampling Tool
// Copyright (c) 2013-2019 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** All exceptions must carry the same data (independently of the
 ** exception type) to homogenize the reporting and processing of
 ** errors.
 **/

#pragma once

#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include <cstdint>
#include <stdexcept>
#include <string>

namespace wrsample {
namespace common {

/// these types can be used to add more info onto an in-flight exception:
///
typedef boost::error_info<struct extra_exception_message, std::string> ExceptionMsg;
typedef boost::error_info<struct exception_field_name, std::string>    FieldNameInfo;
typedef boost::error_info<struct exception_arrival_index, uint64_t>    ArrivalIndexInfo;
typedef boost::error_info<struct exception_stream_line, unsigned>      StreamLineInfo;

/// \brief Base class to all the exception classes
///
/// Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
/// at the throw site.
class ExceptionData : public boost::exception {
public:
  ExceptionData(const std::string& message, const int errorNumber = 0)
    : boost::exception(), _message(message), _errorNumber(errorNumber)
  {
  }

  ExceptionData(const ExceptionData&) = default;
  ExceptionData& operator=(const ExceptionData&) = delete;

  const std::string& getMessage() const { return _message; }

  int getErrorNumber() const { return _errorNumber; }

  std::string getContext() const;

private:
  const std::string _message;
  const int         _errorNumber;
};

class GeneralException : public std::logic_error, public ExceptionData {
public:
  explicit GeneralException(const std::string& message, const int errorNumber = 0)
    : std::logic_error(message), ExceptionData(message, errorNumber)
  {
  }
};

/// \brief Invalid run configuration, detected before any record is read
///
/// e.g. a sample count of zero, a weight or identifier column which is not in the input header
class ConfigurationException : public std::invalid_argument, public ExceptionData {
public:
  explicit ConfigurationException(const std::string& message)
    : std::invalid_argument(message), ExceptionData(message)
  {
  }
};

/// \brief A record does not have the shape declared by the input header
class SchemaException : public std::runtime_error, public ExceptionData {
public:
  explicit SchemaException(const std::string& message) : std::runtime_error(message), ExceptionData(message) {}
};

/// \brief A record which must be weighted has a weight which can't produce a sampling key
///
/// zero, negative, non-finite and unparseable weights all end up here
class WeightException : public std::runtime_error, public ExceptionData {
public:
  explicit WeightException(const std::string& message) : std::runtime_error(message), ExceptionData(message) {}
};

/// \brief A method invocation violates its pre-conditions
class PreConditionException : public std::logic_error, public ExceptionData {
public:
  explicit PreConditionException(const std::string& message)
    : std::logic_error(message), ExceptionData(message)
  {
  }
};

}  // namespace common
}  // namespace wrsample
