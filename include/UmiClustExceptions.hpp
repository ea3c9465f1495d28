#ifndef __UMICLUST_EXCEPTIONS_HPP__
#define __UMICLUST_EXCEPTIONS_HPP__

#include <cstdint>
#include <sstream>
#include <stdexcept>
#include <string>

class FileAccessError : public std::runtime_error {
public:
  FileAccessError(const std::string& path, const std::string& reason);
  virtual const char* what() const throw();

private:
  std::string msg_;
};

class TableFormatError : public std::runtime_error {
public:
  TableFormatError(const std::string& path, const std::string& column);
  TableFormatError(const std::string& path, const std::string& column,
                   const std::string& reason);
  virtual const char* what() const throw();

private:
  std::string msg_;
};

class AlignmentIOError : public std::runtime_error {
public:
  AlignmentIOError(const std::string& path, const std::string& reason);
  virtual const char* what() const throw();

private:
  std::string msg_;
};

class DispatchInterrupted : public std::runtime_error {
public:
  DispatchInterrupted(uint64_t numFinished, uint64_t numBatches) noexcept;
  DispatchInterrupted(const DispatchInterrupted& other);
  virtual const char* what() const throw();

private:
  uint64_t numFinished_;
  uint64_t numBatches_;
  std::ostringstream cnvt;
  std::string msg_;
};

#endif //__UMICLUST_EXCEPTIONS_HPP__
