#pragma once

#include <cstddef>

namespace CryptoPP
{
class AutoSeededRandomPool;
}

namespace rnd
{
/** While this uses CryptoPP do not call any of these functions from global scope, as they depend on global variables inside the CryptoPP library which may not have been initialized yet due to an undefined order for globals in different translation units. */
class random_pool
{
public:
	/** @throws rnd::unavailable_error if the operating system provides no entropy source */
	static void generate_block (unsigned char * output, std::size_t size);

	random_pool () = delete;
	random_pool (random_pool const &) = delete;
	random_pool & operator= (random_pool const &) = delete;

private:
	static CryptoPP::AutoSeededRandomPool & get_pool ();
};
}
