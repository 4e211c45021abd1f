/*
 * Copyright (c) 2026, Alex <uni@vrsal.cc>
 * SPDX-License-Identifier: BSD-3-Clause
 */

#pragma once
#include <string>
#include <vector>

#include "Data/ProbeTypes.hpp"

// Discovery and the subscription lifecycle of an OPC UA server
class IEndpointClient
{
public:
	virtual ~IEndpointClient() = default;

	// Throws LProbeError(Connect)
	virtual std::vector<LEndpointDescriptor> Discover(std::string const& EndpointUrl) = 0;

	// Connects, subscribes to NodeId, waits for the server to set up its callbacks and tears everything down again.
	// Failures are reported through the outcome, never thrown
	virtual LSubscriptionOutcome Subscribe(
		std::string const& EndpointUrl, std::string const& NodeId, int32_t PublishingIntervalMs) = 0;

	// Idempotent
	virtual void Close() = 0;
};
