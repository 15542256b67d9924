#include "sequence.h"

#include <chrono>


int32_t seed_hash(const std::string& seed)
{
	uint32_t h = 0; // unsigned arithmetic wraps the same way as int32 in two's complement
	for (const char c : seed) {
		h = h * 31u + static_cast<uint32_t>(static_cast<unsigned char>(c));
	}
	return static_cast<int32_t>(h);
}

std::string default_seed()
{
	auto const now = std::chrono::system_clock::now().time_since_epoch();
	return std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}


uint32_t sequence_t::next_u32()
{
	state_ += 0x6d2b79f5u;
	uint32_t t = state_;
	t = (t ^ (t >> 15)) * (t | 1u);
	t ^= t + (t ^ (t >> 7)) * (t | 61u);
	return t ^ (t >> 14);
}

double sequence_t::next()
{
	return next_u32() / 4294967296.0;
}

size_t sequence_t::next_index(size_t n)
{
	assert(n > 0);
	auto const idx = static_cast<size_t>(next() * n);
	return idx < n ? idx : n - 1;
}
