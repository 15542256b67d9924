#ifndef SUDOKU_ENGINE_GRID_H_INCLUDED
#define SUDOKU_ENGINE_GRID_H_INCLUDED

#include <array>
#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>


constexpr size_t N = 9;
constexpr size_t Ns = 3; // square side
constexpr size_t CELLS = N * N;

using num_t = uint8_t; // 1..9
using cell_t = std::optional<num_t>;
using grid_t = std::array<std::array<cell_t, N>, N>;


enum class difficulty_t {
	EASY,
	MEDIUM,
	HARD,
	EXPERT
};

size_t target_givens(difficulty_t d);
const char* difficulty_name(difficulty_t d);
difficulty_t difficulty_parse(const std::string& s); // throws on unknown name


grid_t grid_make_empty();

size_t count_givens(const grid_t& g);

// true if "num" can be put into (row,col): not present in the row, column or 3*3 square
bool is_valid_placement(const grid_t& g, size_t row, size_t col, num_t num);

// no duplicates among filled cells of any row, column or square
bool is_consistent(const grid_t& g);

bool is_complete(const grid_t& g);

bool is_solved(const grid_t& g);

// prints every broken row/column/square, returns is_solved()
bool verify(const grid_t& g, std::ostream& os);


// Text format: 81 cells, row-major. '1'..'9' or '*' for an empty cell ('.' and '0' accepted too).
// Whitespace is skipped.
grid_t grid_parse(std::istream& is);
grid_t grid_parse(const std::string& s);

void grid_print(const grid_t& g, std::ostream& os);
std::string grid_flat(const grid_t& g);
void grid_print_json(const grid_t& g, std::ostream& os);

#endif
