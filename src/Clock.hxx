// SPDX-License-Identifier: BSD-2-Clause
// Copyright CM4all GmbH

#pragma once

#include <chrono>

/**
 * The source of wall-clock time for the cache.  All freshness
 * calculations go through this interface, which allows unit tests
 * to control time.
 */
class Clock {
public:
	virtual ~Clock() noexcept = default;

	virtual std::chrono::system_clock::time_point SystemNow() const noexcept = 0;
};

class RealClock final : public Clock {
public:
	std::chrono::system_clock::time_point SystemNow() const noexcept override {
		return std::chrono::system_clock::now();
	}
};
