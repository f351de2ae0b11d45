#include "cvforge/service/TailorService.hpp"
#include "cvforge/util/Logging.hpp"

#include <sstream>

namespace cvforge::service {
namespace {

const std::string& templateOrDefault(const std::string& cvTemplate) {
    return cvTemplate.empty() ? TailorService::defaultCvTemplate() : cvTemplate;
}

std::string descriptionOrPlaceholder(const std::string& description) {
    return description.empty() ? std::string{"No description provided"} : description;
}

} // namespace

TailorService::TailorService(CompletionService& completions, PdfRenderer* renderer)
    : completions_(completions)
    , renderer_(renderer) {}

const std::string& TailorService::defaultCvTemplate() {
    static const std::string kTemplate =
        "John Doe\n"
        "Full Stack Developer\n"
        "Email: john@example.com | Phone: +1234567890\n"
        "\n"
        "SUMMARY\n"
        "Experienced developer with 2 years in React, Node.js, Python...\n"
        "\n"
        "SKILLS\n"
        "- Languages: JavaScript, Python, TypeScript\n"
        "- Frontend: React, Next.js, Tailwind\n"
        "- Backend: Node.js, Express, FastAPI\n"
        "- Database: PostgreSQL, MongoDB\n"
        "\n"
        "EXPERIENCE\n"
        "Software Engineer - ABC Corp (2022-2024)\n"
        "- Built full-stack applications using React and Node.js\n"
        "- Improved application performance by 40%\n"
        "- Led team of 3 developers\n"
        "\n"
        "EDUCATION\n"
        "B.Tech Computer Science - XYZ University (2020-2022)";
    return kTemplate;
}

ai::ChatRequest TailorService::buildCvPrompt(const TailorRequest& request) {
    std::ostringstream prompt;
    prompt << "You are a professional CV writer. Tailor this CV to match the job description below.\n\n"
           << "IMPORTANT RULES:\n"
           << "1. Keep the EXACT same formatting and structure\n"
           << "2. Keep the same section headers (SUMMARY, SKILLS, EXPERIENCE, EDUCATION)\n"
           << "3. Only modify the content to highlight relevant skills for this specific job\n"
           << "4. Keep it concise - same length as original\n"
           << "5. Make it ATS-friendly\n"
           << "6. Return ONLY the tailored CV, no explanations\n\n"
           << "Original CV:\n" << templateOrDefault(request.cvTemplate) << "\n\n"
           << "Job Title: " << request.title << "\n"
           << "Company: " << request.company << "\n\n"
           << "Job Description:\n" << descriptionOrPlaceholder(request.description) << "\n\n"
           << "Tailored CV:";

    return {"You are a professional CV writer who tailors resumes to job descriptions while maintaining formatting.",
            prompt.str()};
}

ai::ChatRequest TailorService::buildCoverLetterPrompt(const TailorRequest& request) {
    std::ostringstream prompt;
    prompt << "Write a professional cover letter for this job application.\n\n"
           << "IMPORTANT RULES:\n"
           << "1. Professional and compelling tone\n"
           << "2. Highlight relevant skills from the CV template\n"
           << "3. Show enthusiasm for the role and company\n"
           << "4. Keep it concise (250-300 words)\n"
           << "5. Include proper greeting and closing\n"
           << "6. Return ONLY the cover letter, no explanations\n\n"
           << "CV Information:\n" << templateOrDefault(request.cvTemplate) << "\n\n"
           << "Job Title: " << request.title << "\n"
           << "Company: " << request.company << "\n\n"
           << "Job Description:\n" << descriptionOrPlaceholder(request.description) << "\n\n"
           << "Cover Letter:";

    return {"You are a professional cover letter writer who creates compelling, personalized cover letters.",
            prompt.str()};
}

TailoredContent TailorService::tailor(const TailorRequest& request) {
    util::log(util::LogLevel::info, "Tailoring CV for " + request.title + " at " + request.company);

    TailoredContent content;
    content.tailoredCv = completions_.complete(buildCvPrompt(request)).content;
    util::log(util::LogLevel::info, "Tailored CV generated, writing cover letter");
    auto letter = completions_.complete(buildCoverLetterPrompt(request));
    content.coverLetter = std::move(letter.content);
    content.apiKeyUsed = std::move(letter.maskedKey);
    content.attempt = letter.attempt;

    if (renderer_) {
        content.cvPdf = renderer_->render(content.tailoredCv, "CV_" + request.title);
        content.coverLetterPdf = renderer_->render(content.coverLetter, "CoverLetter_" + request.title);
        util::log(util::LogLevel::info,
                  "Rendered PDFs (" + std::to_string(content.cvPdf->size()) + " and " +
                      std::to_string(content.coverLetterPdf->size()) + " bytes)");
    }
    return content;
}

} // namespace cvforge::service
