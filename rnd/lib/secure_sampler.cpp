#include <rnd/crypto_lib/random_pool.hpp>
#include <rnd/lib/secure_sampler.hpp>
#include <rnd/lib/utility.hpp>

#include <array>

rnd::os_secure_source::os_secure_source (rnd::logger & logger_a) :
	logger{ logger_a }
{
}

void rnd::os_secure_source::generate_block (std::uint8_t * output, std::size_t size)
{
	try
	{
		rnd::random_pool::generate_block (output, size);
	}
	catch (rnd::unavailable_error const & err)
	{
		logger.error (rnd::log::type::secure_sampler, "Secure random source unavailable: {}", err.what ());
		throw;
	}
}

rnd::secure_sampler::secure_sampler (rnd::secure_source & source_a) :
	source{ source_a }
{
}

std::uint64_t rnd::secure_sampler::rejection_bound (std::uint64_t range_a)
{
	debug_assert (range_a > 0 && range_a <= max_range);
	return (max_range / range_a) * range_a;
}

std::uint64_t rnd::secure_sampler::next_index (std::uint64_t range_a)
{
	auto const bound = rejection_bound (range_a);
	std::uint64_t value;
	do
	{
		value = next_word32 ();
	} while (value >= bound);
	return value % range_a;
}

std::uint32_t rnd::secure_sampler::next_word32 ()
{
	std::array<std::uint8_t, 4> buffer;
	source.generate_block (buffer.data (), buffer.size ());
	return (std::uint32_t{ buffer[0] } << 24) | (std::uint32_t{ buffer[1] } << 16) | (std::uint32_t{ buffer[2] } << 8) | std::uint32_t{ buffer[3] };
}

rnd::secure_sampler & rnd::default_secure_sampler ()
{
	static rnd::os_secure_source source;
	static rnd::secure_sampler sampler{ source };
	return sampler;
}
