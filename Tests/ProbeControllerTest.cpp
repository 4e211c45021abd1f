/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include <algorithm>
#include <stdexcept>
#include <unistd.h>
#include <gtest/gtest.h>

#include "Fakes/FakeEndpointClient.hpp"
#include "Fakes/ScriptedSocketTableSource.hpp"
#include "ProbeController.hpp"
#include "Time.hpp"

class ProbeControllerTest : public ::testing::Test
{
protected:
	stdfs::path                         LogDirectory{};
	std::shared_ptr<LProbeEvents>       Events{ std::make_shared<LProbeEvents>() };
	std::shared_ptr<LCancellationToken> Token{ std::make_shared<LCancellationToken>() };
	LProbeEventStream                   Stream{ Events, Token };
	std::unique_ptr<LProbeLog>          Log{};

	LFakeEndpointClient        Client{};
	LScriptedSocketTableSource Source{};
	LProbeConfig               Config{};
	LProbeSettings             Settings{};

	std::vector<LPercent>          Progress{};
	std::vector<EProbeStage::Type> PartialStages{};
	std::vector<std::string>       Errors{};
	int                            FinalResults = 0;

	void SetUp() override
	{
		LogDirectory = stdfs::temp_directory_path() / fmt::format("lauscher-controller-{}", getpid());
		Log = std::make_unique<LProbeLog>(LogDirectory, LTime::GetEpochMs(), [](std::string const&) {});

		Config.Server = "10.0.0.5";
		Config.Port = 4840;
		Settings.MonitorDuration = LDuration(6000);
		Settings.PollInterval = LDuration(2000);

		Client.Endpoints = { LFakeEndpointClient::MakeEndpoint("None", "None"),
			LFakeEndpointClient::MakeEndpoint("Basic256Sha256", "SignAndEncrypt") };

		Events->OnProgress.connect([this](LProgressEvent const& Event) { Progress.push_back(Event.Percent); });
		Events->OnPartialResult.connect([this](LPartialResult const& Result) { PartialStages.push_back(Result.Stage); });
		Events->OnFinalResult.connect([this](LProbeResult const&) { ++FinalResults; });
		Events->OnError.connect([this](std::string const& Message) { Errors.push_back(Message); });
	}

	void TearDown() override
	{
		Log.reset();
		stdfs::remove_all(LogDirectory);
	}

	LProbeController MakeController()
	{
		return LProbeController(Config, Settings, Client, Source, Stream, *Log, *Token, [](LDuration) { return true; });
	}

	size_t CountWarnings(EProbeStage::Type Stage)
	{
		auto const Warnings = Log->GetWarnings();
		return static_cast<size_t>(std::ranges::count_if(
			Warnings, [&](LProbeIssue const& Issue) { return Issue.Context == EProbeStage::ToString(Stage); }));
	}
};

TEST_F(ProbeControllerTest, CompletedRunAggregatesEveryStage)
{
	Source.Then("  TCP  0.0.0.0:135    0.0.0.0:0  LISTENING  1044\n")
		.Then("  TCP  0.0.0.0:135    0.0.0.0:0  LISTENING  1044\n"
			  "  TCP  0.0.0.0:52000  0.0.0.0:0  LISTENING  2210\n")
		.Then("  TCP  10.0.0.2:52000  10.0.0.5:4840  ESTABLISHED  2210\n");

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
	EXPECT_EQ(Controller.GetEndpointUrl(), "opc.tcp://10.0.0.5:4840");
	EXPECT_EQ(Client.LastEndpointUrl, "opc.tcp://10.0.0.5:4840");
	EXPECT_EQ(Client.LastNodeId, "ns=0;i=2258");
	EXPECT_EQ(Client.LastPublishingIntervalMs, 250);

	EXPECT_EQ(Result.Endpoints.size(), 2u);
	EXPECT_EQ(Result.BeforeListeners.size(), 1u);
	EXPECT_TRUE(Result.Subscription.bSuccess);
	EXPECT_EQ(Result.Subscription.NodeMonitored, "ns=0;i=2258");
	EXPECT_EQ(Result.AfterListeners.size(), 2u);
	EXPECT_EQ(Result.Diff.NewPorts, std::vector<std::string>{ "0.0.0.0:52000" });
	EXPECT_EQ(Result.Diff.NetChange, 1);
	ASSERT_EQ(Result.Connections.size(), 1u);
	EXPECT_EQ(Result.Connections[0].RemoteAddress, "10.0.0.5");

	// 2 listener captures and 3 monitor ticks
	EXPECT_EQ(Source.Captures.load(), 5);

	std::vector<EProbeStage::Type> const Stages{ EProbeStage::QueryEndpoints, EProbeStage::BaselineCapture,
		EProbeStage::Subscribe, EProbeStage::PostCapture, EProbeStage::Monitor };
	EXPECT_EQ(Controller.GetCompletedStages(), Stages);
	EXPECT_EQ(PartialStages, Stages);
	EXPECT_EQ(FinalResults, 1);
	EXPECT_TRUE(Errors.empty());
	EXPECT_TRUE(Log->GetErrors().empty());
	EXPECT_TRUE(Log->GetWarnings().empty());
}

TEST_F(ProbeControllerTest, ProgressHitsEveryCheckpointInOrder)
{
	auto Controller = MakeController();
	(void)Controller.Run();

	EXPECT_EQ(Progress, (std::vector<LPercent>{ 10, 25, 45, 65, 75, 80, 85, 90, 100 }));
}

TEST_F(ProbeControllerTest, DiscoveryFailureIsFatal)
{
	Client.DiscoverError = "BadTimeout";

	auto Controller = MakeController();
	try
	{
		(void)Controller.Run();
		FAIL() << "expected a connect error";
	}
	catch (LProbeError const& e)
	{
		EXPECT_EQ(e.GetKind(), EProbeError::Connect);
	}

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Failed);
	EXPECT_TRUE(Controller.GetCompletedStages().empty());
	EXPECT_TRUE(PartialStages.empty());
	EXPECT_EQ(FinalResults, 0);
	EXPECT_EQ(Client.SubscribeCalls.load(), 0);
	EXPECT_EQ(Source.Captures.load(), 0);

	EXPECT_EQ(Errors, std::vector<std::string>{ "BadTimeout" });
	auto const LoggedErrors = Log->GetErrors();
	ASSERT_EQ(LoggedErrors.size(), 1u);
	EXPECT_EQ(LoggedErrors[0].Context, "Endpoint Query");
	EXPECT_EQ(LoggedErrors[0].Kind, "ConnectError");
}

TEST_F(ProbeControllerTest, ConfigErrorIsFatal)
{
	Config.Port.reset();

	auto Controller = MakeController();
	EXPECT_THROW((void)Controller.Run(), LProbeError);
	EXPECT_EQ(Controller.GetStage(), EProbeStage::Failed);
	EXPECT_EQ(Client.DiscoverCalls.load(), 0);
	EXPECT_EQ(Errors.size(), 1u);

	// rejected before the first stage started
	EXPECT_TRUE(Progress.empty());
	EXPECT_TRUE(Controller.GetCompletedStages().empty());
	auto const LoggedErrors = Log->GetErrors();
	ASSERT_EQ(LoggedErrors.size(), 1u);
	EXPECT_EQ(LoggedErrors[0].Context, "Init");
	EXPECT_EQ(LoggedErrors[0].Kind, "ConfigError");
}

TEST_F(ProbeControllerTest, BaselineFailureDegradesToEmptyList)
{
	Source.ThenFail("netstat exited with status 1")
		.Then("  TCP  0.0.0.0:52000  0.0.0.0:0  LISTENING  2210\n");

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
	EXPECT_EQ(Controller.GetCompletedStages().size(), 5u);
	EXPECT_TRUE(Result.BeforeListeners.empty());
	EXPECT_EQ(Result.AfterListeners.size(), 1u);
	EXPECT_EQ(Result.Diff.NewPorts, std::vector<std::string>{ "0.0.0.0:52000" });
	EXPECT_EQ(CountWarnings(EProbeStage::BaselineCapture), 1u);
	EXPECT_EQ(Log->GetWarnings().size(), 1u);
	EXPECT_TRUE(Log->GetErrors().empty());
	EXPECT_EQ(FinalResults, 1);
}

TEST_F(ProbeControllerTest, PostCaptureFailureDegradesToEmptyList)
{
	Source.Then("  TCP  0.0.0.0:135  0.0.0.0:0  LISTENING  1044\n").ThenFail();

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_TRUE(Result.AfterListeners.empty());
	EXPECT_EQ(Result.Diff.RemovedPorts, std::vector<std::string>{ "0.0.0.0:135" });
	EXPECT_EQ(Result.Diff.NetChange, -1);
	EXPECT_EQ(CountWarnings(EProbeStage::PostCapture), 1u);
}

TEST_F(ProbeControllerTest, UnexpectedCaptureExceptionsDegradeLikeCaptureErrors)
{
	Source.ThenThrow("stoull").ThenThrow("filesystem error").ThenThrow().ThenThrow().ThenThrow();

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
	EXPECT_EQ(Controller.GetCompletedStages().size(), 5u);
	EXPECT_TRUE(Result.BeforeListeners.empty());
	EXPECT_TRUE(Result.AfterListeners.empty());
	EXPECT_TRUE(Result.Connections.empty());
	EXPECT_EQ(CountWarnings(EProbeStage::BaselineCapture), 1u);
	EXPECT_EQ(CountWarnings(EProbeStage::PostCapture), 1u);
	EXPECT_EQ(CountWarnings(EProbeStage::Monitor), 4u);
	EXPECT_TRUE(Log->GetErrors().empty());
	EXPECT_TRUE(Errors.empty());
	EXPECT_EQ(FinalResults, 1);
}

TEST_F(ProbeControllerTest, UnexpectedSubscribeExceptionIsAFailedOutcome)
{
	Client.OnSubscribe = [] { throw std::runtime_error("bad_alloc in client"); };

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
	EXPECT_FALSE(Result.Subscription.bSuccess);
	EXPECT_EQ(Result.Subscription.Error, "bad_alloc in client");
	ASSERT_EQ(Log->GetErrors().size(), 1u);
	EXPECT_EQ(Log->GetErrors()[0].Kind, "SubscriptionError");
	EXPECT_TRUE(Errors.empty());
}

TEST_F(ProbeControllerTest, SubscriptionFailureIsRecordedAndTheRunContinues)
{
	Client.Outcome = LSubscriptionOutcome{ .bSuccess = false, .NodeMonitored = {}, .Error = "BadNodeIdUnknown" };

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
	EXPECT_FALSE(Result.Subscription.bSuccess);
	EXPECT_EQ(Result.Subscription.Error, "BadNodeIdUnknown");
	EXPECT_EQ(Controller.GetCompletedStages().size(), 5u);

	auto const LoggedErrors = Log->GetErrors();
	ASSERT_EQ(LoggedErrors.size(), 1u);
	EXPECT_EQ(LoggedErrors[0].Kind, "SubscriptionError");
	// the run still completed, no error event
	EXPECT_TRUE(Errors.empty());
}

TEST_F(ProbeControllerTest, MonitorFailureDegradesToEmptyAttempts)
{
	Source.Then("").Then("").ThenFail().ThenFail().ThenFail();

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
	EXPECT_TRUE(Result.Connections.empty());
	// one per failed tick plus the monitor failure itself
	EXPECT_EQ(CountWarnings(EProbeStage::Monitor), 4u);
	EXPECT_EQ(FinalResults, 1);
}

TEST_F(ProbeControllerTest, EmptyEndpointListIsAWarning)
{
	Client.Endpoints.clear();

	auto       Controller = MakeController();
	auto const Result = Controller.Run();

	EXPECT_TRUE(Result.Endpoints.empty());
	ASSERT_EQ(Log->GetWarnings().size(), 1u);
	EXPECT_EQ(Log->GetWarnings()[0].Message, "No endpoints returned from server");
	EXPECT_EQ(Controller.GetStage(), EProbeStage::Completed);
}

TEST_F(ProbeControllerTest, CancellationStopsTheRunAndItsEvents)
{
	Client.OnSubscribe = [this] { EXPECT_TRUE(Stream.Close()); };

	auto Controller = MakeController();
	EXPECT_THROW((void)Controller.Run(), LProbeCancelled);

	EXPECT_EQ(PartialStages, (std::vector<EProbeStage::Type>{ EProbeStage::QueryEndpoints, EProbeStage::BaselineCapture }));
	EXPECT_EQ(Progress.back(), 45);
	EXPECT_EQ(FinalResults, 0);
	EXPECT_TRUE(Errors.empty());
	EXPECT_TRUE(Log->GetErrors().empty());
	// the post capture never ran
	EXPECT_EQ(Source.Captures.load(), 1);
}
