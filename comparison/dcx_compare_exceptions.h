#ifndef DCX_COMPARE_EXCEPTIONS_H
#define DCX_COMPARE_EXCEPTIONS_H

#include "../utils/dcx_string.h"
#include <exception>
#include <stdexcept>

// ============================================================================
// COMPARISON EXCEPTION HIERARCHY
// ============================================================================
//
// dcx_compare_exception (base)
// ├── dcx_invalid_zone_error
// ├── dcx_invalid_image_error
// ├── dcx_fingerprint_missing_error
// ├── dcx_invalid_session_error
// └── dcx_document_load_error
//
// An empty document is not an error: matching it yields an all-unmatched
// result. Per-page fingerprint failures are logged, never thrown.
//
// ============================================================================

class dcx_compare_exception : public std::exception {
protected:
  dcx_string message_;

public:
  explicit dcx_compare_exception(const dcx_string& message)
    : message_(message) {}

  virtual ~dcx_compare_exception() noexcept = default;

  virtual const char* what() const noexcept override {
    return message_.c_str();
  }
};

// ============================================================================
// VALIDATION ERRORS
// ============================================================================

// Zone coordinate outside [0, 1] or unknown applies_to value
class dcx_invalid_zone_error : public dcx_compare_exception {
private:
  dcx_string field_;
  double value_;
  dcx_string text_;

public:
  dcx_invalid_zone_error(const dcx_string& field, double value)
    : dcx_compare_exception(
        dcx_string("Exclusion zone ") + field + " must be between 0 and 1, got " + dcx_string(value)),
      field_(field), value_(value), text_("") {}

  dcx_invalid_zone_error(const dcx_string& field, const dcx_string& text)
    : dcx_compare_exception(
        dcx_string("Exclusion zone ") + field + " has invalid value '" + text + "'"),
      field_(field), value_(0.0), text_(text) {}

  dcx_string get_field() const { return field_; }
  double get_value() const { return value_; }
  dcx_string get_text() const { return text_; }
};

// Empty, zero-sized or unsupported image handed to the diff engine
class dcx_invalid_image_error : public dcx_compare_exception {
private:
  dcx_string argument_;

public:
  dcx_invalid_image_error(const dcx_string& argument, const dcx_string& reason)
    : dcx_compare_exception(dcx_string("Invalid image '") + argument + "': " + reason),
      argument_(argument) {}

  dcx_string get_argument() const { return argument_; }
};

// ============================================================================
// PRECONDITION ERRORS
// ============================================================================

// match() was called before ensure_fingerprints() ran over the pages
class dcx_fingerprint_missing_error : public dcx_compare_exception {
private:
  dcx_string side_;
  int page_index_;

public:
  dcx_fingerprint_missing_error(const dcx_string& side, int page_index)
    : dcx_compare_exception(
        dcx_string("Fingerprints not prepared for ") + side + " page " + dcx_string(page_index) +
        ", call ensure_fingerprints() before match()"),
      side_(side), page_index_(page_index) {}

  dcx_string get_side() const { return side_; }
  int get_page_index() const { return page_index_; }
};

// ============================================================================
// PERSISTENCE AND LOADING ERRORS
// ============================================================================

class dcx_invalid_session_error : public dcx_compare_exception {
public:
  using dcx_compare_exception::dcx_compare_exception;
};

class dcx_document_load_error : public dcx_compare_exception {
private:
  dcx_string path_;

public:
  dcx_document_load_error(const dcx_string& path, const dcx_string& reason)
    : dcx_compare_exception(dcx_string("Cannot load '") + path + "': " + reason),
      path_(path) {}

  dcx_string get_path() const { return path_; }
};

#endif // DCX_COMPARE_EXCEPTIONS_H
