#pragma once

#include <mutex>
#include <random>

namespace rnd
{
/** Source of independent doubles uniformly distributed over [0, 1) */
class uniform_source
{
public:
	virtual ~uniform_source () = default;

	/// Generate a random number in the range [0, 1)
	virtual double next () = 0;
};

/**
 * Not safe for any crypto related code, use for non-crypto PRNG only.
 * Seeded once from std::random_device, calls are serialized so an instance can be shared between threads.
 */
class device_source final : public uniform_source
{
public:
	device_source ();

	double next () override;

private:
	std::mutex mutex;
	std::random_device device;
	std::mt19937_64 rng;
};
}
