/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#include "OpcUaEndpointClient.hpp"

#include <algorithm>
#include <chrono>
#include <open62541/client_config_default.h>
#include <open62541/client_highlevel.h>
#include <open62541/client_subscriptions.h>
#include <spdlog/spdlog.h>

#include "ProbeError.hpp"

// Lifetime/keepalive counts the callback listener needs to stay up during the settle delay
constexpr UA_UInt32 kLifetimeCount = 10000;
constexpr UA_UInt32 kMaxKeepAliveCount = 10;
constexpr UA_UInt32 kMaxNotificationsPerPublish = 1000;
constexpr UA_UInt32 kQueueSize = 10;

// Granularity at which the settle delay services the client and checks for cancellation
constexpr LDuration kSettleSlice{ 50 };

std::string LOpcUa::ToString(UA_String const& String)
{
	if (!String.data || String.length == 0)
	{
		return {};
	}
	return { reinterpret_cast<char const*>(String.data), String.length };
}

std::string LOpcUa::TokenTypeName(UA_UserTokenType Type)
{
	switch (Type)
	{
		case UA_USERTOKENTYPE_ANONYMOUS:
			return "Anonymous";
		case UA_USERTOKENTYPE_USERNAME:
			return "UserName";
		case UA_USERTOKENTYPE_CERTIFICATE:
			return "Certificate";
		case UA_USERTOKENTYPE_ISSUEDTOKEN:
			return "IssuedToken";
		default:
			return "Unknown";
	}
}

std::string LOpcUa::SecurityModeName(UA_MessageSecurityMode Mode)
{
	switch (Mode)
	{
		case UA_MESSAGESECURITYMODE_NONE:
			return "None";
		case UA_MESSAGESECURITYMODE_SIGN:
			return "Sign";
		case UA_MESSAGESECURITYMODE_SIGNANDENCRYPT:
			return "SignAndEncrypt";
		default:
			return "Invalid";
	}
}

std::string LOpcUa::StatusText(UA_StatusCode Code)
{
	return fmt::format("{} (0x{:08X})", UA_StatusCode_name(Code), Code);
}

LOpcUaEndpointClient::~LOpcUaEndpointClient()
{
	Close();
}

LOpcUaEndpointClient::LClientPtr LOpcUaEndpointClient::MakeClient() const
{
	LClientPtr Client(UA_Client_new(), &UA_Client_delete);
	if (!Client)
	{
		throw LProbeError(EProbeError::Connect, "failed to allocate OPC UA client");
	}

	UA_ClientConfig* Config = UA_Client_getConfig(Client.get());
	UA_ClientConfig_setDefault(Config);
	Config->timeout = static_cast<UA_UInt32>(Timeout.count());
	return Client;
}

std::vector<LEndpointDescriptor> LOpcUaEndpointClient::Discover(std::string const& EndpointUrl)
{
	auto Client = MakeClient();

	size_t                  EndpointCount = 0;
	UA_EndpointDescription* Endpoints = nullptr;
	UA_StatusCode const     Status = UA_Client_getEndpoints(Client.get(), EndpointUrl.c_str(), &EndpointCount, &Endpoints);
	if (Status != UA_STATUSCODE_GOOD)
	{
		throw LProbeError(
			EProbeError::Connect, fmt::format("GetEndpoints on {} failed: {}", EndpointUrl, LOpcUa::StatusText(Status)));
	}

	std::vector<LEndpointDescriptor> Result{};
	Result.reserve(EndpointCount);
	for (size_t i = 0; i < EndpointCount; ++i)
	{
		UA_EndpointDescription const& Endpoint = Endpoints[i];

		LEndpointDescriptor Descriptor{};
		Descriptor.EndpointUrl = LOpcUa::ToString(Endpoint.endpointUrl);
		Descriptor.SecurityPolicyUri = LOpcUa::ToString(Endpoint.securityPolicyUri);
		Descriptor.SecurityMode = LOpcUa::SecurityModeName(Endpoint.securityMode);
		for (size_t j = 0; j < Endpoint.userIdentityTokensSize; ++j)
		{
			Descriptor.UserIdentityTokens.push_back(LOpcUa::TokenTypeName(Endpoint.userIdentityTokens[j].tokenType));
		}
		Result.push_back(std::move(Descriptor));
	}
	UA_Array_delete(Endpoints, EndpointCount, &UA_TYPES[UA_TYPES_ENDPOINTDESCRIPTION]);

	if (UA_StatusCode const DisconnectStatus = UA_Client_disconnect(Client.get()); DisconnectStatus != UA_STATUSCODE_GOOD)
	{
		spdlog::debug("Disconnect after discovery failed: {}", LOpcUa::StatusText(DisconnectStatus));
	}
	spdlog::debug("Discovered {} endpoint(s) on {}", Result.size(), EndpointUrl);
	return Result;
}

LSubscriptionOutcome LOpcUaEndpointClient::Subscribe(
	std::string const& EndpointUrl, std::string const& NodeId, int32_t PublishingIntervalMs)
{
	LSubscriptionOutcome Outcome{};
	auto const           Fail = [&](std::string Error) {
		Teardown();
		Outcome.bSuccess = false;
		Outcome.Error = std::move(Error);
		return Outcome;
	};

	UA_NodeId     Node = UA_NODEID_NULL;
	UA_StatusCode Status = UA_NodeId_parse(&Node, UA_STRING(const_cast<char*>(NodeId.c_str())));
	if (Status != UA_STATUSCODE_GOOD)
	{
		return Fail(fmt::format("invalid node id '{}': {}", NodeId, LOpcUa::StatusText(Status)));
	}

	UA_Client* Client = nullptr;
	try
	{
		std::lock_guard Lock(Mutex);
		ActiveClient = MakeClient();
		Client = ActiveClient.get();
	}
	catch (LProbeError const& e)
	{
		UA_NodeId_clear(&Node);
		return Fail(e.what());
	}

	Status = UA_Client_connect(Client, EndpointUrl.c_str());
	if (Status != UA_STATUSCODE_GOOD)
	{
		UA_NodeId_clear(&Node);
		return Fail(fmt::format("connect to {} failed: {}", EndpointUrl, LOpcUa::StatusText(Status)));
	}

	UA_CreateSubscriptionRequest Request = UA_CreateSubscriptionRequest_default();
	Request.requestedPublishingInterval = static_cast<UA_Double>(PublishingIntervalMs);
	Request.requestedLifetimeCount = kLifetimeCount;
	Request.requestedMaxKeepAliveCount = kMaxKeepAliveCount;
	Request.maxNotificationsPerPublish = kMaxNotificationsPerPublish;
	Request.publishingEnabled = true;

	UA_CreateSubscriptionResponse Response =
		UA_Client_Subscriptions_create(Client, Request, nullptr, nullptr, nullptr);
	UA_StatusCode const SubscriptionStatus = Response.responseHeader.serviceResult;
	if (SubscriptionStatus != UA_STATUSCODE_GOOD)
	{
		UA_CreateSubscriptionResponse_clear(&Response);
		UA_NodeId_clear(&Node);
		return Fail(fmt::format("CreateSubscription failed: {}", LOpcUa::StatusText(SubscriptionStatus)));
	}
	SubscriptionId = Response.subscriptionId;
	spdlog::debug("Subscription {} created, revised publishing interval {}ms", SubscriptionId,
		Response.revisedPublishingInterval);
	UA_CreateSubscriptionResponse_clear(&Response);

	UA_MonitoredItemCreateRequest ItemRequest = UA_MonitoredItemCreateRequest_default(Node);
	ItemRequest.requestedParameters.samplingInterval = static_cast<UA_Double>(PublishingIntervalMs);
	ItemRequest.requestedParameters.queueSize = kQueueSize;
	ItemRequest.requestedParameters.discardOldest = true;

	UA_MonitoredItemCreateResult ItemResult = UA_Client_MonitoredItems_createDataChange(
		Client, SubscriptionId, UA_TIMESTAMPSTORETURN_BOTH, ItemRequest, nullptr, nullptr, nullptr);
	UA_NodeId_clear(&Node);

	UA_StatusCode const ItemStatus = ItemResult.statusCode;
	UA_MonitoredItemCreateResult_clear(&ItemResult);
	if (ItemStatus != UA_STATUSCODE_GOOD)
	{
		return Fail(fmt::format("CreateMonitoredItems for {} failed: {}", NodeId, LOpcUa::StatusText(ItemStatus)));
	}

	// keep the session serviced while the server opens its callback connections
	auto const Deadline = std::chrono::steady_clock::now() + Settle;
	while (std::chrono::steady_clock::now() < Deadline)
	{
		if (UA_StatusCode const IterateStatus = UA_Client_run_iterate(Client, 0); IterateStatus != UA_STATUSCODE_GOOD)
		{
			spdlog::debug("Servicing the session failed: {}", LOpcUa::StatusText(IterateStatus));
		}

		auto const Remaining =
			std::chrono::duration_cast<LDuration>(Deadline - std::chrono::steady_clock::now());
		if (!Sleep(std::clamp(Remaining, LDuration{ 0 }, kSettleSlice)))
		{
			// cancelled, the run is abandoned and won't look at the outcome
			break;
		}
	}

	Teardown();
	Outcome.bSuccess = true;
	Outcome.NodeMonitored = NodeId;
	return Outcome;
}

void LOpcUaEndpointClient::Teardown()
{
	std::lock_guard Lock(Mutex);
	if (!ActiveClient)
	{
		return;
	}

	if (SubscriptionId != 0)
	{
		UA_StatusCode const Status = UA_Client_Subscriptions_deleteSingle(ActiveClient.get(), SubscriptionId);
		if (Status != UA_STATUSCODE_GOOD)
		{
			spdlog::debug("Deleting subscription {} failed: {}", SubscriptionId, LOpcUa::StatusText(Status));
		}
		SubscriptionId = 0;
	}

	UA_StatusCode const Status = UA_Client_disconnect(ActiveClient.get());
	if (Status != UA_STATUSCODE_GOOD)
	{
		spdlog::debug("Disconnect failed: {}", LOpcUa::StatusText(Status));
	}
	ActiveClient.reset();
}

void LOpcUaEndpointClient::Close()
{
	Teardown();
}
