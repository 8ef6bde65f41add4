#pragma once
#include <stdexcept>
#include <string>

namespace lf {

// Root of the export pipeline's own errors.
struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Image list or image file missing/unreadable.
struct InputError      : Error { using Error::Error; };
// The segmenter could not produce a label map; aborts the run.
struct InferenceError  : Error { using Error::Error; };
// The tracer failed on a category mask; the image is skipped.
struct ExtractionError : Error { using Error::Error; };
// Directory creation or file write failed.
struct WriteError      : Error { using Error::Error; };
// A value could not be represented in the document encoding.
struct EncodeError     : Error { using Error::Error; };

} // namespace lf
