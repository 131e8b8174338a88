#include <rnd/lib/errors.hpp>
#include <rnd/lib/utility.hpp>
#include <rnd/test_common/testutil.hpp>

#include <numeric>

rnd::test::scripted_source::scripted_source (std::vector<double> values_a) :
	values{ std::move (values_a) }
{
	debug_assert (!values.empty ());
}

double rnd::test::scripted_source::next ()
{
	return values[position++ % values.size ()];
}

std::size_t rnd::test::scripted_source::draws () const
{
	return position;
}

double rnd::test::counting_source::next ()
{
	++count;
	return source.next ();
}

std::size_t rnd::test::counting_source::draws () const
{
	return count;
}

rnd::test::scripted_secure_source::scripted_secure_source (std::vector<std::uint8_t> bytes_a) :
	bytes{ std::move (bytes_a) }
{
}

void rnd::test::scripted_secure_source::generate_block (std::uint8_t * output, std::size_t size)
{
	if (bytes.empty ())
	{
		throw rnd::unavailable_error (rnd::error_source::unavailable);
	}
	for (std::size_t i = 0; i < size; ++i)
	{
		output[i] = bytes[position++ % bytes.size ()];
	}
}

std::size_t rnd::test::scripted_secure_source::consumed () const
{
	return position;
}

double rnd::test::chi_square (std::vector<std::size_t> const & observed)
{
	auto const total = std::accumulate (observed.begin (), observed.end (), std::size_t{ 0 });
	auto const expected = static_cast<double> (total) / static_cast<double> (observed.size ());
	double result = 0.0;
	for (auto count : observed)
	{
		auto const difference = static_cast<double> (count) - expected;
		result += difference * difference / expected;
	}
	return result;
}
