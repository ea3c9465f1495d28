#include "UmiClustExceptions.hpp"

FileAccessError::FileAccessError(const std::string& path,
                               const std::string& reason)
    : std::runtime_error("") {
  msg_ = "could not use file " + path + " : " + reason;
}

const char* FileAccessError::what() const throw() { return msg_.c_str(); }

TableFormatError::TableFormatError(const std::string& path,
                                   const std::string& column)
    : std::runtime_error("") {
  msg_ = "the header of table " + path + " has no column named '" + column +
         "'";
}

TableFormatError::TableFormatError(const std::string& path,
                                   const std::string& column,
                                   const std::string& reason)
    : std::runtime_error("") {
  msg_ = "table " + path + ", column '" + column + "' : " + reason;
}

const char* TableFormatError::what() const throw() { return msg_.c_str(); }

AlignmentIOError::AlignmentIOError(const std::string& path,
                                   const std::string& reason)
    : std::runtime_error("") {
  msg_ = "alignment file " + path + " : " + reason;
}

const char* AlignmentIOError::what() const throw() { return msg_.c_str(); }

DispatchInterrupted::DispatchInterrupted(uint64_t numFinished,
                                         uint64_t numBatches) noexcept
    : std::runtime_error(""), numFinished_(numFinished),
      numBatches_(numBatches) {
  cnvt.str("");
  cnvt << "UMI clustering was interrupted after " << numFinished_ << " of "
       << numBatches_
       << " batches had finished. No partial results were kept and no "
          "output was written.";
  msg_ = cnvt.str();
}

DispatchInterrupted::DispatchInterrupted(const DispatchInterrupted& other)
    : std::runtime_error("") {
  msg_ = other.msg_;
  numFinished_ = other.numFinished_;
  numBatches_ = other.numBatches_;
}

const char* DispatchInterrupted::what() const throw() { return msg_.c_str(); }
