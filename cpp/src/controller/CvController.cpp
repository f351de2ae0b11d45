#include "cvforge/controller/CvController.hpp"
#include "cvforge/key/KeyPool.hpp"
#include "cvforge/util/Base64.hpp"
#include "cvforge/util/JsonUtil.hpp"
#include "cvforge/util/Logging.hpp"

#include <boost/asio/post.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <exception>
#include <optional>
#include <string>

namespace cvforge::controller {
namespace {

std::string trimmed(const std::string& value) {
    const auto begin = value.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(begin, end - begin + 1);
}

std::optional<service::TailorRequest> parseTailorRequest(const std::string& payload, std::string& problem) {
    boost::json::value parsed;
    try {
        parsed = util::parseJson(payload);
    } catch (const util::JsonError&) {
        problem = "request body must be valid JSON";
        return std::nullopt;
    }
    if (!parsed.is_object()) {
        problem = "request body must be a JSON object";
        return std::nullopt;
    }
    const auto& object = parsed.as_object();

    service::TailorRequest request;
    request.title = trimmed(util::readString(object, "title").value_or(""));
    request.company = trimmed(util::readString(object, "company").value_or(""));
    request.description = util::readString(object, "description").value_or("");
    request.cvTemplate = util::readString(object, "cv_template").value_or("");
    request.url = trimmed(util::readString(object, "url").value_or(""));

    if (request.title.empty()) {
        problem = "field 'title' is required";
        return std::nullopt;
    }
    if (request.company.empty()) {
        problem = "field 'company' is required";
        return std::nullopt;
    }
    return request;
}

boost::beast::http::status toHttpStatus(int status) {
    if (status < 400 || status > 599) {
        return boost::beast::http::status::bad_gateway;
    }
    return static_cast<boost::beast::http::status>(status);
}

boost::json::value pdfField(const std::optional<std::string>& pdf) {
    if (!pdf) {
        return nullptr;
    }
    return boost::json::string(util::base64Encode(*pdf));
}

} // namespace

CvController::CvController(service::TailorService& tailorService, boost::asio::thread_pool& worker)
    : tailorService_(tailorService)
    , worker_(worker) {}

void CvController::registerRoutes(server::Router& router) {
    router.addRoute("POST", "/tailor-cv", [this](auto& ctx) { handleTailorCv(ctx); });
}

void CvController::handleTailorCv(server::RequestContext& ctx) {
    std::string problem;
    auto request = parseTailorRequest(ctx.request.body(), problem);
    if (!request) {
        ctx.replyJson(boost::beast::http::status::unprocessable_entity, boost::json::object{{"message", problem}});
        return;
    }

    boost::asio::post(worker_, [this, job = std::move(*request), reply = ctx.deferResponse()] {
        reply(tailor(job));
    });
}

server::RequestContext::Response CvController::tailor(const service::TailorRequest& request) {
    using boost::beast::http::status;
    server::RequestContext::Response response;
    try {
        auto content = tailorService_.tailor(request);
        const bool rendered = content.cvPdf.has_value();
        boost::json::object body;
        body["message"] = rendered ? "CV and cover letter PDFs generated successfully"
                                   : "CV and cover letter generated successfully";
        body["job_title"] = request.title;
        body["company"] = request.company;
        if (request.url.empty()) {
            body["url"] = nullptr;
        } else {
            body["url"] = request.url;
        }
        body["cv_text"] = content.tailoredCv;
        body["cover_letter_text"] = content.coverLetter;
        body["cv_pdf"] = pdfField(content.cvPdf);
        body["cover_letter_pdf"] = pdfField(content.coverLetterPdf);
        body["api_key_used"] = content.apiKeyUsed;
        body["attempt"] = static_cast<std::int64_t>(content.attempt);
        server::RequestContext::writeJson(response, status::ok, body);
    } catch (const key::NoKeysAvailableError& ex) {
        auto seconds = std::chrono::ceil<std::chrono::seconds>(ex.retryAfter()).count();
        if (seconds < 1) {
            seconds = 1;
        }
        util::log(util::LogLevel::warn, "Tailoring rejected, all API keys cooling down");
        server::RequestContext::writeJson(
            response, status::service_unavailable,
            boost::json::object{{"message", "All API keys are currently unavailable. Please try again later."},
                                {"retry_after_seconds", seconds}});
        response.set(boost::beast::http::field::retry_after, std::to_string(seconds));
    } catch (const service::CompletionError& ex) {
        server::RequestContext::writeJson(response, toHttpStatus(ex.status()),
                                          boost::json::object{{"message", ex.what()}});
    } catch (const service::RenderError& ex) {
        util::log(util::LogLevel::error, std::string{"PDF rendering failed: "} + ex.what());
        server::RequestContext::writeJson(response, status::internal_server_error,
                                          boost::json::object{{"message", "Failed to render PDF documents"}});
    } catch (const std::exception& ex) {
        util::log(util::LogLevel::error, std::string{"Tailoring failed: "} + ex.what());
        server::RequestContext::writeJson(response, status::internal_server_error,
                                          boost::json::object{{"message", "internal server error"}});
    }
    return response;
}

} // namespace cvforge::controller
