/**
 * @file test_advisor.cpp
 * @brief Unit tests for the fallback and model-backed advisors.
 * @author Dimitris Kafetzis
 */

#include "advisor/fallback_advisor.hpp"
#include "advisor/model_advisor.hpp"
#include "telemetry/json_sink.hpp"

#include <gtest/gtest.h>
#include <deque>
#include <memory>

using namespace task_orchestrator;

// ─── Helpers ─────────────────────────────────

/// Replays canned replies and remembers every request it saw.
class ScriptedClient : public ICompletionClient {
public:
    struct Script {
        std::deque<Result<std::string>> replies;
        std::vector<CompletionRequest> requests;
    };

    explicit ScriptedClient(std::shared_ptr<Script> script) : script_(std::move(script)) {}

    Result<std::string> complete(const CompletionRequest& request) override {
        script_->requests.push_back(request);
        if (script_->replies.empty()) {
            return Error{ErrorCode::AdvisorFailure, "no scripted reply"};
        }
        auto reply = std::move(script_->replies.front());
        script_->replies.pop_front();
        return reply;
    }

private:
    std::shared_ptr<Script> script_;
};

class ModelAdvisorTest : public ::testing::Test {
protected:
    void SetUp() override {
        script_ = std::make_shared<ScriptedClient::Script>();
        advisor_ = std::make_unique<ModelBackedAdvisor>(
            std::make_unique<ScriptedClient>(script_), AdvisorConfig{.mode = "model"}, logger_);
    }

    void reply(std::string text) { script_->replies.emplace_back(std::move(text)); }

    Logger logger_{std::make_unique<NullSink>()};
    std::shared_ptr<ScriptedClient::Script> script_;
    std::unique_ptr<ModelBackedAdvisor> advisor_;
};

static PlanRequest sample_plan_request() {
    return PlanRequest{
        .project_name = "Portal",
        .goal = "Ship the customer portal",
        .description = "Self-service account pages",
        .acceptance_criteria = {"Users can log in", "Users can edit profile"}
    };
}

static SpecRequest sample_spec_request() {
    return SpecRequest{
        .task_name = "Login form",
        .task_description = "Render and validate the login form",
        .project_context = "Project ID: 1",
        .inputs = {{"credentials", "username and password"}},
        .outputs = {{"session", "authenticated session"}},
        .tests = Document::array({{{"type", "unit"}, {"description", "rejects empty password"}},
                                  "accepts valid credentials"})
    };
}

// ─── Validation ──────────────────────────────

TEST(AdvisorValidationTest, MissingFieldNamed) {
    Document doc = {{"status", "pass"}, {"overall_score", 0.9}};
    auto result = validate_required(doc, kVerificationRequiredFields);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().is(ErrorCode::AdvisorFailure));
    EXPECT_NE(result.error().message.find("checks"), std::string::npos);
}

TEST(AdvisorValidationTest, NonObjectRejected) {
    EXPECT_FALSE(validate_required(Document::array(), kSpecRequiredFields).has_value());
}

TEST(AdvisorValidationTest, PlanWithUnknownRiskRejected) {
    Document doc = {{"tasks", Document::array()}, {"risk_level", "extreme"}};
    EXPECT_FALSE(parse_plan(doc).has_value());
}

// ─── Fallback ────────────────────────────────

TEST(FallbackAdvisorTest, PlanShape) {
    FallbackAdvisor advisor;
    auto plan = advisor.generate_plan(sample_plan_request());
    ASSERT_TRUE(plan.has_value());

    ASSERT_EQ(plan->tasks.size(), 3u);
    EXPECT_EQ(plan->risk_level, RiskLevel::Medium);
    EXPECT_EQ(plan->estimated_total_hours, 8.0);

    EXPECT_EQ(plan->tasks[0].name, "Research and Requirements");
    EXPECT_EQ(plan->tasks[0].estimate_hours, 2.0);
    EXPECT_TRUE(plan->tasks[0].requires_approval);
    EXPECT_TRUE(plan->tasks[0].dependencies.empty());

    EXPECT_EQ(plan->tasks[1].estimate_hours, 4.0);
    EXPECT_FALSE(plan->tasks[1].requires_approval);
    EXPECT_EQ(plan->tasks[1].dependencies, std::vector<size_t>{0});

    EXPECT_TRUE(plan->tasks[2].requires_approval);
    EXPECT_EQ(plan->tasks[2].dependencies, std::vector<size_t>{1});
}

TEST(FallbackAdvisorTest, PlanMentionsGoal) {
    auto doc = FallbackAdvisor::plan_document(sample_plan_request());
    EXPECT_EQ(doc["tasks"][0]["description"], "Analyze requirements for: Ship the customer portal");
}

TEST(FallbackAdvisorTest, SpecMirrorsTask) {
    FallbackAdvisor advisor;
    auto spec = advisor.generate_spec(sample_spec_request());
    ASSERT_TRUE(spec.has_value());
    EXPECT_TRUE(validate_required(*spec, kSpecRequiredFields).has_value());

    EXPECT_EQ((*spec)["task_name"], "Login form");
    EXPECT_EQ((*spec)["confidence_score"], 0.5);
    EXPECT_EQ((*spec)["inputs"]["credentials"]["description"], "username and password");
    EXPECT_EQ((*spec)["outputs"]["session"]["description"], "authenticated session");

    const auto& cases = (*spec)["test_cases"];
    ASSERT_EQ(cases.size(), 2u);
    EXPECT_EQ(cases[0]["name"], "Test 1");
    EXPECT_EQ(cases[0]["expected_behavior"], "rejects empty password");
    EXPECT_EQ(cases[1]["type"], "unit");
    EXPECT_EQ(cases[1]["expected_behavior"], "accepts valid credentials");
}

TEST(FallbackAdvisorTest, CleanArtifactPasses) {
    FallbackAdvisor advisor;
    auto report = advisor.verify_artifact({.filename = "main.py", .content = "print('hello')"});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ((*report)["status"], "pass");
    EXPECT_EQ((*report)["overall_score"], 1.0);
    ASSERT_EQ((*report)["checks"].size(), 1u);
    EXPECT_EQ((*report)["checks"][0]["check_name"], "basic_validation");
    EXPECT_EQ((*report)["summary"]["passed"], 1);
}

TEST(FallbackAdvisorTest, RiskyPatternsWarn) {
    FallbackAdvisor advisor;
    auto report = advisor.verify_artifact({
        .filename = "deploy.py",
        .content = "API_KEY = 'abc'\nos.system(cmd)\n"
    });
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ((*report)["status"], "warning");
    EXPECT_EQ((*report)["summary"]["warnings"], 2);
    EXPECT_EQ((*report)["summary"]["failed"], 0);
    EXPECT_EQ((*report)["security_issues"].size(), 2u);
    EXPECT_DOUBLE_EQ((*report)["overall_score"].get<double>(), 0.8);
}

TEST(FallbackAdvisorTest, ScoreFloor) {
    FallbackAdvisor advisor;
    auto report = advisor.verify_artifact({
        .filename = "all.js",
        .content = "password token secret api_key eval( exec( innerHTML " + std::string(100001, 'x')
    });
    ASSERT_TRUE(report.has_value());
    EXPECT_DOUBLE_EQ((*report)["overall_score"].get<double>(), 0.5);
}

// ─── Model-backed ────────────────────────────

TEST(ModelAdvisorParseTest, FencedJson) {
    auto doc = ModelBackedAdvisor::parse_reply("Here you go:\n```json\n{\"a\": 1}\n```\nDone.");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ((*doc)["a"], 1);
}

TEST(ModelAdvisorParseTest, BareFence) {
    auto doc = ModelBackedAdvisor::parse_reply("```\n[1, 2]\n```");
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->size(), 2u);
}

TEST(ModelAdvisorParseTest, InvalidJson) {
    auto doc = ModelBackedAdvisor::parse_reply("I could not do that.");
    ASSERT_FALSE(doc.has_value());
    EXPECT_EQ(doc.error().message, "Invalid JSON response from model");
}

TEST_F(ModelAdvisorTest, ValidPlanUsed) {
    reply(R"({"tasks": [{"name": "Only step", "estimate_hours": 5, "dependencies": []}],
              "risk_level": "high"})");
    auto plan = advisor_->generate_plan(sample_plan_request());
    ASSERT_TRUE(plan.has_value());
    ASSERT_EQ(plan->tasks.size(), 1u);
    EXPECT_EQ(plan->tasks[0].name, "Only step");
    EXPECT_EQ(plan->risk_level, RiskLevel::High);

    ASSERT_EQ(script_->requests.size(), 1u);
    EXPECT_NE(script_->requests[0].user_prompt.find("- Users can log in"), std::string::npos);
    EXPECT_EQ(script_->requests[0].model, "gpt-4");
}

TEST_F(ModelAdvisorTest, InvalidJsonFallsBack) {
    reply("not json at all");
    auto plan = advisor_->generate_plan(sample_plan_request());
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->tasks.size(), 3u);
    EXPECT_EQ(plan->tasks[0].name, "Research and Requirements");
}

TEST_F(ModelAdvisorTest, MissingFieldsFallBack) {
    reply(R"({"task_name": "Login form", "objective": "x"})");
    auto spec = advisor_->generate_spec(sample_spec_request());
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ((*spec)["confidence_score"], 0.5);
    EXPECT_TRUE((*spec).contains("test_cases"));
}

TEST_F(ModelAdvisorTest, ClientErrorFallsBack) {
    script_->replies.emplace_back(Error{ErrorCode::AdvisorFailure, "timeout"});
    auto report = advisor_->verify_artifact({.filename = "a.txt", .content = "hello"});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ((*report)["status"], "pass");
}

TEST_F(ModelAdvisorTest, ValidSpecUsed) {
    reply(R"(```json
{"task_name": "Login form", "objective": "log in", "inputs": {}, "outputs": {},
 "test_cases": [], "confidence_score": 0.9}
```)");
    auto spec = advisor_->generate_spec(sample_spec_request());
    ASSERT_TRUE(spec.has_value());
    EXPECT_EQ((*spec)["confidence_score"], 0.9);
}

TEST_F(ModelAdvisorTest, VerificationContentTruncated) {
    reply(R"({"status": "pass", "overall_score": 0.95, "checks": []})");
    std::string big(ModelBackedAdvisor::kMaxVerificationChars + 500, 'y');
    auto report = advisor_->verify_artifact({.filename = "big.txt", .content = big});
    ASSERT_TRUE(report.has_value());
    EXPECT_EQ((*report)["overall_score"], 0.95);

    ASSERT_EQ(script_->requests.size(), 1u);
    const auto& prompt = script_->requests[0].user_prompt;
    EXPECT_NE(prompt.find("... (content truncated)"), std::string::npos);
    EXPECT_EQ(prompt.find(std::string(ModelBackedAdvisor::kMaxVerificationChars + 1, 'y')),
              std::string::npos);
    EXPECT_DOUBLE_EQ(script_->requests[0].temperature, 0.3);
}

TEST(ModelAdvisorNoClientTest, AlwaysFallsBack) {
    Logger logger{std::make_unique<NullSink>()};
    ModelBackedAdvisor advisor{nullptr, AdvisorConfig{}, logger};
    auto plan = advisor.generate_plan(sample_plan_request());
    ASSERT_TRUE(plan.has_value());
    EXPECT_EQ(plan->tasks.size(), 3u);
}
