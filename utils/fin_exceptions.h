#ifndef fin_EXCEPTIONS_H
#define fin_EXCEPTIONS_H

#include "fin_string.h"
#include <exception>

// fin_ingest_exception (base)
// └── fin_store_error

class fin_ingest_exception : public std::exception {
protected:
  fin_string message_;

public:
  explicit fin_ingest_exception(const fin_string& message)
    : message_(message) {}

  const char* what() const noexcept override {
    return message_.c_str();
  }
};

// A chunk store could not persist or read data
class fin_store_error : public fin_ingest_exception {
public:
  using fin_ingest_exception::fin_ingest_exception;
};

#endif // fin_EXCEPTIONS_H
