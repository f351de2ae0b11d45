#pragma once

#include <stdexcept>
#include <string>

namespace cvforge::service {

class RenderError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Turns plain text into a PDF document. Implementations throw RenderError.
class PdfRenderer {
public:
    virtual ~PdfRenderer() = default;

    // Returns the raw PDF bytes.
    virtual std::string render(const std::string& text, const std::string& title) = 0;
};

} // namespace cvforge::service
