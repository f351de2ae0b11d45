#pragma once

#include "cvforge/ai/ChatClient.hpp"
#include "cvforge/service/CompletionService.hpp"
#include "cvforge/service/PdfRenderer.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace cvforge::service {

struct TailorRequest {
    std::string title;
    std::string company;
    std::string description;
    std::string cvTemplate;
    // Job posting the request came from; echoed back, never fetched.
    std::string url;
};

struct TailoredContent {
    std::string tailoredCv;
    std::string coverLetter;
    // Key and attempt of the cover-letter completion, the last one made.
    std::string apiKeyUsed;
    std::size_t attempt{};
    // Raw PDF bytes, present only when a renderer is configured.
    std::optional<std::string> cvPdf;
    std::optional<std::string> coverLetterPdf;
};

class TailorService {
public:
    explicit TailorService(CompletionService& completions, PdfRenderer* renderer = nullptr);

    // Two independent completions: the rewritten CV, then the cover letter.
    TailoredContent tailor(const TailorRequest& request);

    static ai::ChatRequest buildCvPrompt(const TailorRequest& request);
    static ai::ChatRequest buildCoverLetterPrompt(const TailorRequest& request);
    static const std::string& defaultCvTemplate();

private:
    CompletionService& completions_;
    PdfRenderer* renderer_;
};

} // namespace cvforge::service
