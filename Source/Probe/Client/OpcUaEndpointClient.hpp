/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <memory>
#include <mutex>
#include <open62541/client.h>

#include "EndpointClient.hpp"
#include "Types.hpp"

namespace LOpcUa
{
	std::string ToString(UA_String const& String);

	// "Anonymous", "UserName", "Certificate", "IssuedToken"
	std::string TokenTypeName(UA_UserTokenType Type);

	// "None", "Sign", "SignAndEncrypt"
	std::string SecurityModeName(UA_MessageSecurityMode Mode);

	std::string StatusText(UA_StatusCode Code);
} // namespace LOpcUa

// open62541 backed endpoint client, one UA_Client per operation
class LOpcUaEndpointClient : public IEndpointClient
{
	using LClientPtr = std::unique_ptr<UA_Client, decltype(&UA_Client_delete)>;

	std::mutex     Mutex;
	LClientPtr     ActiveClient{ nullptr, &UA_Client_delete };
	UA_UInt32      SubscriptionId{};
	LDuration      Settle;
	LDuration      Timeout;
	LSleepFunction Sleep;

	LClientPtr MakeClient() const;

	void Teardown();

public:
	LOpcUaEndpointClient(LDuration Settle_, LDuration Timeout_, LSleepFunction Sleep_)
		: Settle(Settle_)
		, Timeout(Timeout_)
		, Sleep(std::move(Sleep_))
	{
	}

	~LOpcUaEndpointClient() override;

	std::vector<LEndpointDescriptor> Discover(std::string const& EndpointUrl) override;

	LSubscriptionOutcome Subscribe(
		std::string const& EndpointUrl, std::string const& NodeId, int32_t PublishingIntervalMs) override;

	void Close() override;
};
