#include <rnd/crypto_lib/random_pool.hpp>

#include <gtest/gtest.h>

#include <array>
#include <cstdint>
#include <thread>

TEST (random_pool, generate_block)
{
	std::array<uint8_t, 32> first{};
	std::array<uint8_t, 32> second{};
	rnd::random_pool::generate_block (first.data (), first.size ());
	rnd::random_pool::generate_block (second.data (), second.size ());
	ASSERT_NE (first, second);
}

TEST (random_pool, empty_block)
{
	std::array<uint8_t, 1> block{ 0x5a };
	rnd::random_pool::generate_block (block.data (), 0);
	ASSERT_EQ (0x5a, block[0]);
}

/** Each thread seeds its own pool */
TEST (random_pool, multithreading)
{
	std::array<std::array<uint8_t, 16>, 2> blocks{};
	std::thread first ([&blocks] { rnd::random_pool::generate_block (blocks[0].data (), blocks[0].size ()); });
	std::thread second ([&blocks] { rnd::random_pool::generate_block (blocks[1].data (), blocks[1].size ()); });
	first.join ();
	second.join ();
	ASSERT_NE (blocks[0], blocks[1]);
}
