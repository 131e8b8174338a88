#include <rnd/crypto_lib/random_pool.hpp>
#include <rnd/lib/errors.hpp>

#include <cryptopp/osrng.h>

void rnd::random_pool::generate_block (unsigned char * output, std::size_t size)
{
	auto & pool = get_pool ();
	pool.GenerateBlock (output, size);
}

CryptoPP::AutoSeededRandomPool & rnd::random_pool::get_pool ()
{
	try
	{
		// Seeding reads the OS entropy device, a failure is retried on the next call
		static thread_local CryptoPP::AutoSeededRandomPool pool;
		return pool;
	}
	catch (CryptoPP::OS_RNG_Err const & err)
	{
		throw rnd::unavailable_error (rnd::error_source::unavailable, err.what ());
	}
}
