#include <rnd/lib/random.hpp>

#include <array>
#include <limits>

rnd::device_source::device_source ()
{
	std::array<std::random_device::result_type, std::mt19937_64::state_size> seed_data;
	for (auto & value : seed_data)
	{
		value = device ();
	}
	std::seed_seq seed (seed_data.begin (), seed_data.end ());
	rng.seed (seed);
}

double rnd::device_source::next ()
{
	// Top 53 bits scaled by 2^-53, never rounds up to 1.0
	static_assert (std::numeric_limits<double>::digits == 53);
	std::lock_guard<std::mutex> guard{ mutex };
	return static_cast<double> (rng () >> 11) * 0x1.0p-53;
}
