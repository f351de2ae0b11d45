#include <gtest/gtest.h>
#include "FakePdfRenderer.hpp"
#include "ScriptedChatClient.hpp"
#include "cvforge/key/KeyPool.hpp"
#include "cvforge/service/CompletionService.hpp"
#include "cvforge/service/TailorService.hpp"

#include <string>
#include <utility>
#include <vector>

using cvforge::key::KeyPool;
using cvforge::key::KeyPoolOptions;
using cvforge::service::CompletionService;
using cvforge::service::TailorRequest;
using cvforge::service::TailorService;
using cvforge::test::ScriptedChatClient;

namespace {

bool contains(const std::string& haystack, const std::string& needle) {
    return haystack.find(needle) != std::string::npos;
}

TailorRequest backendRole() {
    TailorRequest request;
    request.title = "Backend Engineer";
    request.company = "Initech";
    request.description = "Own the billing pipeline in C++ and PostgreSQL.";
    return request;
}

} // namespace

TEST(TailorServiceTest, CvPromptCarriesJobDetailsAndDefaultTemplate) {
    auto prompt = TailorService::buildCvPrompt(backendRole());

    EXPECT_TRUE(contains(prompt.systemPrompt, "CV writer"));
    EXPECT_TRUE(contains(prompt.userPrompt, "Job Title: Backend Engineer"));
    EXPECT_TRUE(contains(prompt.userPrompt, "Company: Initech"));
    EXPECT_TRUE(contains(prompt.userPrompt, "Own the billing pipeline"));
    EXPECT_TRUE(contains(prompt.userPrompt, TailorService::defaultCvTemplate()));
    EXPECT_TRUE(contains(prompt.userPrompt, "Tailored CV:"));
}

TEST(TailorServiceTest, CustomTemplateReplacesDefault) {
    auto request = backendRole();
    request.cvTemplate = "Jane Roe\nSystems Programmer";

    auto prompt = TailorService::buildCoverLetterPrompt(request);
    EXPECT_TRUE(contains(prompt.userPrompt, "Jane Roe\nSystems Programmer"));
    EXPECT_FALSE(contains(prompt.userPrompt, "John Doe"));
    EXPECT_TRUE(contains(prompt.userPrompt, "Cover Letter:"));
}

TEST(TailorServiceTest, MissingDescriptionUsesPlaceholder) {
    auto request = backendRole();
    request.description.clear();

    EXPECT_TRUE(contains(TailorService::buildCvPrompt(request).userPrompt, "No description provided"));
    EXPECT_TRUE(contains(TailorService::buildCoverLetterPrompt(request).userPrompt, "No description provided"));
}

TEST(TailorServiceTest, TailorRunsTwoCompletionsInOrder) {
    KeyPool pool({"key-a", "key-b"}, KeyPoolOptions{});
    ScriptedChatClient client;
    CompletionService completions(pool, client);
    TailorService service(completions);

    client.pushOk("CV body");
    client.pushOk("Dear hiring manager");

    auto content = service.tailor(backendRole());
    EXPECT_EQ(content.tailoredCv, "CV body");
    EXPECT_EQ(content.coverLetter, "Dear hiring manager");

    ASSERT_EQ(client.requests.size(), 2u);
    EXPECT_TRUE(contains(client.requests[0].userPrompt, "Tailored CV:"));
    EXPECT_TRUE(contains(client.requests[1].userPrompt, "Cover Letter:"));
    EXPECT_EQ(client.keysSeen, (std::vector<std::string>{"key-a", "key-b"}));
    EXPECT_EQ(content.apiKeyUsed, cvforge::key::maskKey("key-b"));
    EXPECT_EQ(content.attempt, 1u);
    EXPECT_FALSE(content.cvPdf.has_value());
    EXPECT_FALSE(content.coverLetterPdf.has_value());
}

TEST(TailorServiceTest, RendererReceivesBothDocuments) {
    KeyPool pool({"gsk_alpha_key_0001", "gsk_bravo_key_0002"}, KeyPoolOptions{});
    ScriptedChatClient client;
    CompletionService completions(pool, client);
    cvforge::test::FakePdfRenderer renderer;
    TailorService service(completions, &renderer);

    client.pushOk("CV body");
    client.pushStatus(429, "rate limit reached");
    client.pushOk("Dear hiring manager");

    auto content = service.tailor(backendRole());
    EXPECT_EQ(content.apiKeyUsed, "gsk_al...0001");
    EXPECT_EQ(content.attempt, 2u);

    ASSERT_EQ(renderer.calls.size(), 2u);
    EXPECT_EQ(renderer.calls[0], std::make_pair(std::string{"CV body"}, std::string{"CV_Backend Engineer"}));
    EXPECT_EQ(renderer.calls[1].second, "CoverLetter_Backend Engineer");
    ASSERT_TRUE(content.cvPdf.has_value());
    EXPECT_EQ(*content.cvPdf, "%PDF-fake CV_Backend Engineer\nCV body");
    EXPECT_EQ(*content.coverLetterPdf, "%PDF-fake CoverLetter_Backend Engineer\nDear hiring manager");
}

TEST(TailorServiceTest, RenderFailurePropagates) {
    KeyPool pool({"key-a"}, KeyPoolOptions{});
    ScriptedChatClient client;
    CompletionService completions(pool, client);
    cvforge::test::FakePdfRenderer renderer;
    renderer.failWith = "font missing";
    TailorService service(completions, &renderer);

    client.pushOk("CV body");
    client.pushOk("Dear hiring manager");

    EXPECT_THROW(service.tailor(backendRole()), cvforge::service::RenderError);
}
