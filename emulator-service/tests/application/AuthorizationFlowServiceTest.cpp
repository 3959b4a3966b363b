/**
 * @file AuthorizationFlowServiceTest.cpp
 * @brief Unit tests for AuthorizationFlowService
 */

#include <gtest/gtest.h>
#include "application/AuthorizationFlowService.hpp"
#include <vector>

using namespace emulator;
using namespace emulator::application;
using domain::AuthorizationStep;
using ports::input::FlowOutcome;

class AuthorizationFlowServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        settings_ = std::make_shared<settings::LoginFlowSettings>();
        service_ = std::make_shared<AuthorizationFlowService>(settings_);
    }

    std::string startSession() {
        return service_->startSession("client-1", "http://localhost/callback", "xyz").sessionId;
    }

    std::shared_ptr<settings::LoginFlowSettings> settings_;
    std::shared_ptr<AuthorizationFlowService> service_;
};

// ============================================================================
// HAPPY PATH
// ============================================================================

TEST_F(AuthorizationFlowServiceTest, StartSession_AwaitsCredentials) {
    auto session = service_->startSession("client-1", "http://localhost/callback", "xyz");

    EXPECT_FALSE(session.sessionId.empty());
    EXPECT_EQ(session.step, AuthorizationStep::AWAITING_CREDENTIALS);
    EXPECT_EQ(session.clientId, "client-1");
    EXPECT_EQ(session.state, "xyz");
    EXPECT_FALSE(session.authorizationCode.has_value());
}

TEST_F(AuthorizationFlowServiceTest, FullFlow_IssuesAuthorizationCode) {
    auto sid = startSession();

    auto login = service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword());
    ASSERT_TRUE(login.success());
    EXPECT_EQ(login.session->step, AuthorizationStep::AWAITING_SECOND_FACTOR);

    auto otp = service_->submitSecondFactor(sid, settings_->getOtp());
    ASSERT_TRUE(otp.success());
    EXPECT_EQ(otp.session->step, AuthorizationStep::AWAITING_CONSENT);

    auto consent = service_->confirmConsent(sid);
    ASSERT_TRUE(consent.success());
    EXPECT_EQ(consent.session->step, AuthorizationStep::CODE_ISSUED);
    ASSERT_TRUE(consent.session->authorizationCode.has_value());
    EXPECT_EQ(consent.session->authorizationCode->rfind("AUTH_CODE_", 0), 0u);
}

// ============================================================================
// FAILURES
// ============================================================================

TEST_F(AuthorizationFlowServiceTest, WrongPassword_StaysOnCredentials) {
    auto sid = startSession();

    auto result = service_->submitCredentials(sid, settings_->getEmail(), "wrong");

    EXPECT_EQ(result.outcome, FlowOutcome::INVALID_CREDENTIALS);
    EXPECT_EQ(result.message, "Invalid email or password");
    EXPECT_EQ(service_->findSession(sid)->step, AuthorizationStep::AWAITING_CREDENTIALS);

    // Повторная попытка с верными данными проходит
    EXPECT_TRUE(service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword()).success());
}

TEST_F(AuthorizationFlowServiceTest, WrongOtp_StaysOnSecondFactor) {
    auto sid = startSession();
    service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword());

    auto result = service_->submitSecondFactor(sid, "000000-wrong");

    EXPECT_EQ(result.outcome, FlowOutcome::INVALID_CREDENTIALS);
    EXPECT_EQ(service_->findSession(sid)->step, AuthorizationStep::AWAITING_SECOND_FACTOR);
}

TEST_F(AuthorizationFlowServiceTest, UnknownSession_Rejected) {
    auto result = service_->submitCredentials("nope", settings_->getEmail(), settings_->getPassword());

    EXPECT_EQ(result.outcome, FlowOutcome::UNKNOWN_SESSION);
    EXPECT_FALSE(result.session.has_value());
    EXPECT_FALSE(service_->findSession("nope").has_value());
}

TEST_F(AuthorizationFlowServiceTest, ConsentBeforeSecondFactor_WrongStep) {
    auto sid = startSession();
    service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword());

    auto result = service_->confirmConsent(sid);

    EXPECT_EQ(result.outcome, FlowOutcome::WRONG_STEP);
    EXPECT_EQ(result.session->step, AuthorizationStep::AWAITING_SECOND_FACTOR);
    EXPECT_FALSE(result.session->authorizationCode.has_value());
}

TEST_F(AuthorizationFlowServiceTest, SecondFactorBeforeCredentials_WrongStep) {
    auto sid = startSession();

    auto result = service_->submitSecondFactor(sid, settings_->getOtp());

    EXPECT_EQ(result.outcome, FlowOutcome::WRONG_STEP);
}

TEST_F(AuthorizationFlowServiceTest, ConfirmTwice_SecondIsUnknownSession) {
    auto sid = startSession();
    service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword());
    service_->submitSecondFactor(sid, settings_->getOtp());
    auto first = service_->confirmConsent(sid);
    ASSERT_TRUE(first.success());

    auto second = service_->confirmConsent(sid);

    EXPECT_EQ(second.outcome, FlowOutcome::UNKNOWN_SESSION);
    EXPECT_FALSE(second.session.has_value());
}

TEST_F(AuthorizationFlowServiceTest, Sessions_AreIndependent) {
    auto a = startSession();
    auto b = startSession();
    ASSERT_NE(a, b);

    service_->submitCredentials(a, settings_->getEmail(), settings_->getPassword());

    EXPECT_EQ(service_->findSession(a)->step, AuthorizationStep::AWAITING_SECOND_FACTOR);
    EXPECT_EQ(service_->findSession(b)->step, AuthorizationStep::AWAITING_CREDENTIALS);
}

// ============================================================================
// ВРЕМЯ ЖИЗНИ СЕССИЙ
// ============================================================================

TEST_F(AuthorizationFlowServiceTest, ConfirmConsent_RemovesSession) {
    auto sid = startSession();
    service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword());
    service_->submitSecondFactor(sid, settings_->getOtp());

    auto consent = service_->confirmConsent(sid);

    ASSERT_TRUE(consent.success());
    EXPECT_TRUE(consent.session->authorizationCode.has_value());
    EXPECT_FALSE(service_->findSession(sid).has_value());
}

TEST_F(AuthorizationFlowServiceTest, ManyCompletedFlows_NothingRetained) {
    std::vector<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        auto sid = startSession();
        service_->submitCredentials(sid, settings_->getEmail(), settings_->getPassword());
        service_->submitSecondFactor(sid, settings_->getOtp());
        ASSERT_TRUE(service_->confirmConsent(sid).success());
        ids.push_back(sid);
    }

    for (const auto& sid : ids) {
        EXPECT_FALSE(service_->findSession(sid).has_value());
    }
}

TEST_F(AuthorizationFlowServiceTest, AbandonedSession_EvictedOnNextStart) {
    auto expiring = std::make_shared<settings::LoginFlowSettings>(
        settings_->getEmail(), settings_->getPassword(), settings_->getOtp(), -1);
    AuthorizationFlowService service(expiring);

    auto abandoned = service.startSession("client-1", "", "").sessionId;
    service.submitCredentials(abandoned, expiring->getEmail(), expiring->getPassword());

    auto fresh = service.startSession("client-2", "", "").sessionId;

    EXPECT_FALSE(service.findSession(abandoned).has_value());
    EXPECT_TRUE(service.findSession(fresh).has_value());
}

TEST_F(AuthorizationFlowServiceTest, ActiveSession_KeptWithinTtl) {
    auto a = startSession();
    startSession();

    EXPECT_TRUE(service_->findSession(a).has_value());
}
