#ifndef SUDOKU_ENGINE_SEQUENCE_H_INCLUDED
#define SUDOKU_ENGINE_SEQUENCE_H_INCLUDED

#include <cstddef>
#include <cstdint>
#include <iterator>
#include <string>
#include <utility>

#include <assert.h>


// Rolling hash: h = h*31 + c, wrapped to int32
int32_t seed_hash(const std::string& seed);

// current time in milliseconds, as decimal text
std::string default_seed();


// Reproducible pseudo-random stream (mulberry32). The whole state is one 32-bit word,
// so two instances built from the same seed return the same values in the same order.
class sequence_t {
	uint32_t state_;
public:
	explicit sequence_t(int32_t seed) : state_(static_cast<uint32_t>(seed)) {}
	explicit sequence_t(const std::string& seed) : sequence_t(seed_hash(seed)) {}

	uint32_t next_u32();

	// [0,1)
	double next();

	// [0,n)
	size_t next_index(size_t n);
};


// Fisher-Yates, consumes one draw per element except the first
template <typename Range>
void shuffle(Range& range, sequence_t& seq)
{
	auto const size = static_cast<size_t>(std::end(range) - std::begin(range));
	auto const first = std::begin(range);
	for (size_t i = size; i > 1; --i) {
		auto const j = seq.next_index(i);
		assert(j < i);
		using std::swap;
		swap(*(first + (i - 1)), *(first + j));
	}
}

#endif
