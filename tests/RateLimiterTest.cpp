// RateLimiterTest.cpp

// Tests the RateLimiter token buckets: refilling, capacity bounds, non-waiting and waiting acquisition





#include <iostream>
#include <cmath>
#include <atomic>
#include <thread>
#include <vector>
#include <limits>
#include <utility>
#include <QThread>
#include <QElapsedTimer>
#include "../src/RateLimiter.hpp"
#include "../src/Exception.hpp"





/** Global failure flag, any failing test sets this to true.
The program's exit status is set according to this value. */
static bool g_HasFailed = false;





/** Reports the failure if the condition doesn't hold. */
static void expect(bool aCondition, const char * aDescription)
{
	if (!aCondition)
	{
		std::cerr << "FAILED: " << aDescription << std::endl;
		g_HasFailed = true;
	}
}





/** Five tokens can be taken from a full bucket of 5, the sixth is refused; one second refills one token. */
static void testCapacityAndRefill()
{
	RateLimiter limiter;
	limiter.createLimit("src", 5, 1);
	for (int i = 0; i < 5; ++i)
	{
		expect(limiter.acquire("src", 1, true), "Acquiring from a full bucket succeeds");
	}
	expect(!limiter.acquire("src", 1, false), "Acquiring from an empty bucket without waiting fails");
	QThread::msleep(1000);
	auto count = limiter.tokenCount("src");
	expect(count.first, "The token count is available for a known key");
	expect(std::abs(count.second - 1.0) < 0.1, "One second refills one token");
	if (std::abs(count.second - 1.0) >= 0.1)
	{
		std::cerr << "  Token count after 1 sec: " << count.second << std::endl;
	}
}





/** The token count never exceeds the capacity, nor drops below zero. */
static void testBounds()
{
	RateLimiter limiter;
	limiter.createLimit("src", 3, 50);
	for (int i = 0; i < 200; ++i)
	{
		limiter.acquire("src", (i % 3 == 0) ? 0.5 : 1.0, false);
		auto count = limiter.tokenCount("src");
		expect(count.second >= 0, "Token count is not negative");
		expect(count.second <= 3, "Token count doesn't exceed the capacity");
		if (i % 20 == 0)
		{
			QThread::msleep(30);
		}
	}

	// A long idle period doesn't overfill the bucket:
	QThread::msleep(200);
	auto count = limiter.tokenCount("src");
	expect(std::abs(count.second - 3) < 1e-6, "An idle bucket is refilled exactly to its capacity");
}





/** Unknown keys are not limited at all. */
static void testUnknownKeyFailsOpen()
{
	RateLimiter limiter;
	expect(limiter.acquire("unknown", 100, false), "Acquiring from an unknown key without waiting succeeds");
	expect(limiter.acquire("unknown", 1, true), "Acquiring from an unknown key with waiting succeeds");
	expect(!limiter.tokenCount("unknown").first, "Unknown key has no token count");
	expect(!limiter.hasLimit("unknown"), "Unknown key has no limit");
}





/** Re-creating a limit resets the bucket to full. */
static void testRecreateResets()
{
	RateLimiter limiter;
	limiter.createLimit("src", 2, 0.001);
	expect(limiter.acquire("src", 2, false), "Taking the whole capacity succeeds");
	expect(!limiter.acquire("src", 1, false), "The bucket is empty");
	limiter.createLimit("src", 2, 0.001);
	expect(std::abs(limiter.tokenCount("src").second - 2) < 1e-6, "Re-created bucket is full");
}





/** A waiting acquire blocks for approximately deficit / fillRate. */
static void testWaitingAcquire()
{
	RateLimiter limiter;
	limiter.createLimit("src", 1, 10);
	expect(limiter.acquire("src", 1, false), "First token is available");
	QElapsedTimer timer;
	timer.start();
	expect(limiter.acquire("src", 1, true), "Waiting acquire succeeds");
	auto elapsed = timer.elapsed();
	expect(elapsed >= 90, "Waiting acquire waits for the refill");
	expect(elapsed < 1000, "Waiting acquire doesn't wait much longer than needed");
	if ((elapsed < 90) || (elapsed >= 1000))
	{
		std::cerr << "  Waited " << elapsed << " msec for 0.1 sec worth of refill" << std::endl;
	}
}





/** Waiting for more tokens than the bucket can hold is a programming error. */
static void testImpossibleWait()
{
	RateLimiter limiter;
	limiter.createLimit("src", 2, 1);
	bool hasThrown = false;
	try
	{
		limiter.acquire("src", 5, true);
	}
	catch (const LogicError &)
	{
		hasThrown = true;
	}
	expect(hasThrown, "Waiting for more tokens than the capacity throws a LogicError");
	expect(!limiter.acquire("src", 5, false), "Non-waiting acquire of more tokens than the capacity fails");
}





/** A thread waiting for one key doesn't block the acquisition of another key. */
static void testWaitDoesntBlockOtherKeys()
{
	RateLimiter limiter;
	limiter.createLimit("slow", 1, 1);
	limiter.createLimit("fast", 10, 10);
	limiter.acquire("slow", 1, false);

	std::thread waiter([&limiter]()
		{
			limiter.acquire("slow", 1, true);
		}
	);
	QThread::msleep(50);  // Let the waiter start waiting
	QElapsedTimer timer;
	timer.start();
	expect(limiter.acquire("fast", 1, true), "Acquiring another key succeeds");
	expect(timer.elapsed() < 200, "Acquiring another key doesn't wait for the other key's refill");
	waiter.join();
}





/** Concurrent acquirers never get more tokens than what was available. */
static void testConcurrentAcquire()
{
	RateLimiter limiter;
	limiter.createLimit("src", 100, 0.001);
	std::atomic<int> numAcquired(0);
	std::vector<std::thread> threads;
	for (int t = 0; t < 4; ++t)
	{
		threads.emplace_back([&limiter, &numAcquired]()
			{
				for (int i = 0; i < 50; ++i)
				{
					if (limiter.acquire("src", 1, false))
					{
						numAcquired += 1;
					}
				}
			}
		);
	}
	for (auto & thr: threads)
	{
		thr.join();
	}
	expect(numAcquired.load() == 100, "Concurrent acquirers get exactly the capacity");
}





/** The fixed-point conversions keep 6 decimal digits. */
static void testFixedPoint()
{
	expect(RateLimiter::toFixed(1.0) == RateLimiter::SCALE, "One token is SCALE units");
	expect(RateLimiter::toFixed(0.000001) == 1, "The smallest unit is a millionth of a token");
	expect(std::abs(RateLimiter::fromFixed(RateLimiter::toFixed(2.5)) - 2.5) < 1e-9, "Conversions are exact for representable values");

	// Many tiny acquisitions add up exactly:
	RateLimiter limiter;
	limiter.createLimit("src", 1, 0.000001);
	for (int i = 0; i < 1000; ++i)
	{
		limiter.acquire("src", 0.001, false);
	}
	expect(limiter.tokenCount("src").second < 0.00001, "A thousand acquisitions of 0.001 drain a bucket of 1");
}





/** Requests too large for the fixed-point representation, or not numbers at all, are refused
and leave the bucket untouched. */
static void testHugeAndInvalidRequests()
{
	RateLimiter limiter;
	limiter.createLimit("src", 5, 1);
	expect(!limiter.acquire("src", 1e13, false), "A non-waiting acquire of 1e13 tokens is refused");
	expect(!limiter.acquire("src", 1e300, false), "A non-waiting acquire of 1e300 tokens is refused");
	auto count = limiter.tokenCount("src");
	expect((count.second >= 0) && (count.second <= 5), "A refused huge acquire keeps the count within the bucket bounds");
	expect(std::abs(count.second - 5) < 1e-6, "A refused huge acquire takes no tokens");

	bool hasThrown = false;
	try
	{
		limiter.acquire("src", 1e13, true);
	}
	catch (const LogicError &)
	{
		hasThrown = true;
	}
	expect(hasThrown, "Waiting for 1e13 tokens throws a LogicError");

	for (auto invalid: {std::nan(""), std::numeric_limits<double>::infinity(), -1.0})
	{
		hasThrown = false;
		try
		{
			limiter.acquire("src", invalid, false);
		}
		catch (const LogicError &)
		{
			hasThrown = true;
		}
		expect(hasThrown, "Acquiring a NaN, infinite or negative number of tokens throws a LogicError");
	}
	count = limiter.tokenCount("src");
	expect((count.second >= 0) && (count.second <= 5), "Invalid requests keep the count within the bucket bounds");
	expect(limiter.acquire("src", 5, false), "The bucket is still full after the invalid requests");

	// Unknown keys are still not limited, whatever the amount:
	expect(limiter.acquire("unknown", 1e13, false), "A huge acquire for an unknown key is allowed");

	// The conversion saturates instead of overflowing:
	expect(RateLimiter::toFixed(1e300) > 0, "Converting a huge positive value saturates");
	expect(RateLimiter::toFixed(-1e300) < 0, "Converting a huge negative value saturates");
	expect(RateLimiter::toFixed(std::nan("")) == 0, "Converting NaN yields zero");
}





/** Non-finite bucket parameters are refused. */
static void testInvalidLimit()
{
	RateLimiter limiter;
	for (auto params: std::vector<std::pair<double, double>>{
		{std::nan(""), 1},
		{5, std::nan("")},
		{std::numeric_limits<double>::infinity(), 1},
	})
	{
		bool hasThrown = false;
		try
		{
			limiter.createLimit("src", params.first, params.second);
		}
		catch (const LogicError &)
		{
			hasThrown = true;
		}
		expect(hasThrown, "Creating a limit with a non-finite capacity or fill rate throws a LogicError");
	}
	expect(!limiter.hasLimit("src"), "A refused limit is not created");
}





int main()
{
	testCapacityAndRefill();
	testBounds();
	testUnknownKeyFailsOpen();
	testRecreateResets();
	testWaitingAcquire();
	testImpossibleWait();
	testWaitDoesntBlockOtherKeys();
	testConcurrentAcquire();
	testFixedPoint();
	testHugeAndInvalidRequests();
	testInvalidLimit();

	if (!g_HasFailed)
	{
		std::cerr << "All tests passed" << std::endl;
	}
	return g_HasFailed ? 1 : 0;
}
