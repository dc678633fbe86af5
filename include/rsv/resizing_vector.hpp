#pragma once

#include <algorithm>
#include <array>
#include <cassert>
#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <limits>
#include <new>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <vector>

namespace rsv {

// Where an element went during resizing_vector::compact()
struct position {
	size_t prev_idx;
	size_t new_idx;
	auto changed() const -> bool {
		return prev_idx != new_idx;
	}
	friend auto operator==(const position& a, const position& b) -> bool { return a.prev_idx == b.prev_idx && a.new_idx == b.new_idx; }
	friend auto operator!=(const position& a, const position& b) -> bool { return !(a == b); }
	friend auto operator<(const position& a, const position& b) -> bool {
		return a.prev_idx < b.prev_idx || (a.prev_idx == b.prev_idx && a.new_idx < b.new_idx);
	}
};

// Decides how much backing storage to allocate when an insert
// lands beyond the current capacity. This only affects capacity(),
// reserved_space() always grows to exactly idx + 1.
struct resizing_vector_default_reserve_strategy {
	static auto reserve(size_t current_capacity, size_t required_slots) -> size_t {
		if (current_capacity >= required_slots) {
			return current_capacity;
		}
		if (required_slots > std::numeric_limits<size_t>::max() / 2) {
			return required_slots;
		}
		return required_slots * 2;
	}
};

namespace resizing_vector_detail {

// Raw bytes for one T, aligned for T
template <typename T>
struct alignas(alignof(T)) storage_for : public std::array<std::byte, sizeof(T)> {};

template <typename T>
struct cell_base_t {
	using storage_t = storage_for<T>;
	cell_base_t() = default;
	cell_base_t(const cell_base_t<T>& rhs) = delete;
	cell_base_t(cell_base_t<T>&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) {
		if (rhs.occupied_) {
			initialize_value(std::move(rhs.get_value()));
			rhs.destroy_value();
		}
	}
	auto operator=(const cell_base_t<T>& rhs) -> cell_base_t& = delete;
	auto operator=(cell_base_t<T>&& rhs) noexcept(std::is_nothrow_move_constructible_v<T>) -> cell_base_t& {
		if (this == &rhs) {
			return *this;
		}
		reset();
		if (rhs.occupied_) {
			initialize_value(std::move(rhs.get_value()));
			rhs.destroy_value();
		}
		return *this;
	}
	~cell_base_t() {
		reset();
	}
	// The cell is only marked occupied once construction succeeds
	template <typename... Args>
	auto initialize_value(Args&&... args) -> void {
		assert (!occupied_);
		::new(std::addressof(storage_)) T(std::forward<Args>(args)...);
		occupied_ = true;
	}
	auto is_occupied() const -> bool {
		return occupied_;
	}
	auto get_value() -> T& {
		assert (occupied_);
		return *std::launder(reinterpret_cast<T*>(std::addressof(storage_)));
	}
	auto get_value() const -> const T& {
		assert (occupied_);
		return *std::launder(reinterpret_cast<const T*>(std::addressof(storage_)));
	}
	auto take_value() -> T {
		T out(std::move(get_value()));
		destroy_value();
		return out;
	}
	auto destroy_value() -> void {
		get_value().~T();
		occupied_ = false;
	}
	auto reset() -> void {
		if (occupied_) {
			destroy_value();
		}
	}
private:
	bool occupied_{false};
	storage_t storage_;
};

// Copyable only when T is. Otherwise std::vector would pick the
// copy constructor for a move-only T whose move can throw.
template <typename T, bool Copyable = std::is_copy_constructible_v<T>>
struct cell_t : public cell_base_t<T> {
	cell_t() = default;
	cell_t(const cell_t& rhs)
		: cell_base_t<T>()
	{
		if (rhs.is_occupied()) {
			this->initialize_value(rhs.get_value());
		}
	}
	cell_t(cell_t&& rhs) = default;
	auto operator=(const cell_t& rhs) -> cell_t& {
		if (this == &rhs) {
			return *this;
		}
		this->reset();
		if (rhs.is_occupied()) {
			this->initialize_value(rhs.get_value());
		}
		return *this;
	}
	auto operator=(cell_t&& rhs) -> cell_t& = default;
};

template <typename T>
struct cell_t<T, false> : public cell_base_t<T> {
	cell_t() = default;
	cell_t(cell_t&& rhs) = default;
	auto operator=(cell_t&& rhs) -> cell_t& = default;
};

template <typename T>
using cell_vector_t = std::vector<cell_t<T>>;

// Visits occupied cells only, in ascending index order.
// CellVector is const-qualified for the const iterator.
template <typename CellVector, typename Value>
struct iterator_t
{
	using iterator_category = std::forward_iterator_tag;
	using difference_type   = std::ptrdiff_t;
	using value_type        = std::remove_const_t<Value>;
	using pointer           = Value*;
	using reference         = Value&;
	iterator_t() = default;
	iterator_t(CellVector* cells, size_t position)
		: cells_{cells}
		, position_{position}
	{
		skip_empty_cells();
	}
	// Mutable to const conversion
	template <typename OtherCells, typename OtherValue,
		typename = std::enable_if_t<!std::is_same_v<OtherValue, Value> && std::is_convertible_v<OtherValue*, Value*>>>
	iterator_t(const iterator_t<OtherCells, OtherValue>& rhs)
		: cells_{rhs.cells_}
		, position_{rhs.position_}
	{
	}
	auto operator*() const -> reference {
		return (*cells_)[position_].get_value();
	}
	auto operator->() const -> pointer {
		return &(*cells_)[position_].get_value();
	}
	auto index() const { return position_; }
	auto operator++() -> iterator_t& {
		position_++;
		skip_empty_cells();
		return *this;
	}
	auto operator++(int) -> iterator_t {
		iterator_t tmp = *this;
		++(*this);
		return tmp;
	}
	friend bool operator== (const iterator_t& a, const iterator_t& b) { return a.position_ == b.position_; };
	friend bool operator!= (const iterator_t& a, const iterator_t& b) { return a.position_ != b.position_; };
private:
	auto skip_empty_cells() -> void {
		while (position_ < cells_->size() && !(*cells_)[position_].is_occupied()) {
			position_++;
		}
	}
	template <typename, typename> friend struct iterator_t;
	CellVector* cells_{nullptr};
	size_t position_{0};
};

} // resizing_vector_detail

// An array keyed by index where any slot may be empty.
//
// Inserting at an index past the end grows the vector so that
// the index exists, every new slot in between starts out empty.
// Indices of existing elements never change except through
// compact(), which packs the occupied slots to the front and
// reports where each element went.
//
// There is no generation tracking. Once a slot is removed its
// index may be handed to a different element by a later insert
// or by compact(), so indices held across those calls may
// silently refer to something else.
//
// Not thread safe.
template <typename T, typename ReserveStrategy = resizing_vector_default_reserve_strategy>
class resizing_vector
{
	using cells_t = resizing_vector_detail::cell_vector_t<T>;
public:
	using iterator_t = resizing_vector_detail::iterator_t<cells_t, T>;
	using const_iterator_t = resizing_vector_detail::iterator_t<const cells_t, const T>;

	resizing_vector() = default;
	resizing_vector(const resizing_vector& rhs) = default;
	resizing_vector(resizing_vector&& rhs) noexcept
		: cells_{std::move(rhs.cells_)}
		, filled_{std::exchange(rhs.filled_, 0)}
	{
		rhs.cells_.clear();
	}
	explicit resizing_vector(std::vector<T> values) {
		cells_.reserve(values.size());
		for (auto& value : values) {
			cells_.emplace_back();
			cells_.back().initialize_value(std::move(value));
			filled_++;
		}
	}
	resizing_vector(std::initializer_list<T> values)
		: resizing_vector(std::vector<T>(values))
	{
	}
	auto operator=(const resizing_vector& rhs) -> resizing_vector& = default;
	auto operator=(resizing_vector&& rhs) noexcept -> resizing_vector& {
		if (this == &rhs) {
			return *this;
		}
		cells_ = std::move(rhs.cells_);
		filled_ = std::exchange(rhs.filled_, 0);
		rhs.cells_.clear();
		return *this;
	}

	// Pre-allocates enough empty slots that any index below
	// capacity can be inserted without resizing
	[[nodiscard]] static auto prefill(size_t capacity) -> resizing_vector {
		resizing_vector out;
		out.cells_.resize(capacity);
		return out;
	}

	// Total number of slots, occupied or not. After inserting at
	// 0 and 2 into a fresh vector this is 3.
	auto reserved_space() const -> size_t { return cells_.size(); }

	// Number of occupied slots, always <= reserved_space()
	auto filled() const -> size_t { return filled_; }

	auto empty() const -> bool { return filled_ == 0; }
	auto capacity() const -> size_t { return cells_.capacity(); }
	auto max_size() const -> size_t { return cells_.max_size(); }

	auto reserve(size_t slots) -> void {
		if (slots > max_size()) {
			throw std::length_error{"rsv::resizing_vector::reserve: too many slots"};
		}
		cells_.reserve(slots);
	}

	auto is_valid(size_t idx) const -> bool {
		return idx < cells_.size() && cells_[idx].is_occupied();
	}

	// Returns nullptr if idx is out of range or the slot is empty
	auto get(size_t idx) -> T* {
		if (!is_valid(idx)) {
			return nullptr;
		}
		return &cells_[idx].get_value();
	}
	auto get(size_t idx) const -> const T* {
		if (!is_valid(idx)) {
			return nullptr;
		}
		return &cells_[idx].get_value();
	}

	auto at(size_t idx) -> T& {
		if (!is_valid(idx)) {
			throw std::out_of_range{"rsv::resizing_vector::at: slot is empty or out of range"};
		}
		return cells_[idx].get_value();
	}
	auto at(size_t idx) const -> const T& {
		if (!is_valid(idx)) {
			throw std::out_of_range{"rsv::resizing_vector::at: slot is empty or out of range"};
		}
		return cells_[idx].get_value();
	}

	auto operator[](size_t idx) -> T& {
		assert (is_valid(idx));
		return cells_[idx].get_value();
	}
	auto operator[](size_t idx) const -> const T& {
		assert (is_valid(idx));
		return cells_[idx].get_value();
	}

	// Puts the value at idx and returns whatever was there before.
	//
	// If idx >= reserved_space() the vector is first grown to
	// idx + 1 slots, so the cost of this call depends on how far
	// past the end idx is.
	template <typename U = T>
	auto insert(size_t idx, U&& value) -> std::optional<T> {
		// Built before growing since value may refer into this vector
		T next(std::forward<U>(value));
		grow_to_fit(idx);
		auto& cell{cells_[idx]};
		std::optional<T> prev;
		if (cell.is_occupied()) {
			prev.emplace(cell.take_value());
			filled_--;
		}
		cell.initialize_value(std::move(next));
		filled_++;
		return prev;
	}

	// Same growth rules as insert() but constructs the value in
	// place when idx is an empty slot within reserved_space().
	// Any previous occupant is destroyed.
	template <typename... Args>
	auto emplace(size_t idx, Args&&... args) -> T& {
		if (is_valid(idx) || idx >= cells_.size()) {
			// args may refer into this vector, either to the occupant
			// or to cells that growing would move
			T next(std::forward<Args>(args)...);
			grow_to_fit(idx);
			auto& cell{cells_[idx]};
			if (cell.is_occupied()) {
				cell.destroy_value();
				filled_--;
			}
			cell.initialize_value(std::move(next));
			filled_++;
			return cell.get_value();
		}
		auto& cell{cells_[idx]};
		cell.initialize_value(std::forward<Args>(args)...);
		filled_++;
		return cell.get_value();
	}

	// Empties the slot and returns what was in it. Out of range
	// indices are ignored. reserved_space() is never reduced.
	auto remove(size_t idx) -> std::optional<T> {
		if (!is_valid(idx)) {
			return std::nullopt;
		}
		std::optional<T> prev{cells_[idx].take_value()};
		filled_--;
		return prev;
	}

	auto clear() -> void {
		cells_t{}.swap(cells_);
		filled_ = 0;
	}

	// Packs the occupied slots to the front, keeping their relative
	// order, and shrinks reserved_space() down to filled().
	//
	// Returns one position per element in ascending index order,
	// including the elements which didn't move.
	//
	//   rsv::resizing_vector<std::string> v;
	//   v.insert(5, "5th");                  // [-, -, -, -, -, "5th"]
	//   auto positions{v.compact()};         // ["5th"]
	//   positions == {{5, 0}}
	[[nodiscard]] auto compact() -> std::vector<position> {
		cells_t cells;
		std::vector<position> positions;
		cells.reserve(filled_);
		positions.reserve(filled_);
		for (size_t idx = 0; idx < cells_.size(); idx++) {
			auto& cell{cells_[idx]};
			if (!cell.is_occupied()) {
				continue;
			}
			positions.push_back(position{idx, cells.size()});
			cells.emplace_back();
			cells.back().initialize_value(std::move(cell.get_value()));
		}
		assert (cells.size() == filled_);
		cells_ = std::move(cells);
		return positions;
	}

	auto begin() { return iterator_t(&cells_, 0); }
	auto end() { return iterator_t(&cells_, cells_.size()); }
	auto begin() const { return const_iterator_t(&cells_, 0); }
	auto end() const { return const_iterator_t(&cells_, cells_.size()); }
	auto cbegin() const { return begin(); }
	auto cend() const { return end(); }

	friend auto operator==(const resizing_vector& a, const resizing_vector& b) -> bool {
		if (a.cells_.size() != b.cells_.size() || a.filled_ != b.filled_) {
			return false;
		}
		for (size_t idx = 0; idx < a.cells_.size(); idx++) {
			const auto& lhs{a.cells_[idx]};
			const auto& rhs{b.cells_[idx]};
			if (lhs.is_occupied() != rhs.is_occupied()) {
				return false;
			}
			if (lhs.is_occupied() && !(lhs.get_value() == rhs.get_value())) {
				return false;
			}
		}
		return true;
	}
	friend auto operator!=(const resizing_vector& a, const resizing_vector& b) -> bool {
		return !(a == b);
	}
private:
	auto grow_to_fit(size_t idx) -> void {
		if (idx < cells_.size()) {
			return;
		}
		// Checked first so that idx + 1 can't wrap
		if (idx >= max_size()) {
			throw std::length_error{"rsv::resizing_vector: index exceeds max_size()"};
		}
		const auto required{idx + 1};
		if (required > cells_.capacity()) {
			cells_.reserve(std::clamp(ReserveStrategy::reserve(cells_.capacity(), required), required, max_size()));
		}
		cells_.resize(required);
	}
	cells_t cells_;
	size_t filled_{0};
};

} // rsv
