#pragma once

// ----------------------------------------------------------------
// Sequential ID allocator
// ----------------------------------------------------------------

#include <assert.h>
#include <iterator>
#include <limits>
#include <optional>
#include <set>

namespace corten {

// Allocator for integral IDs in [lb, ub]. Provides O(log n) allocation and deallocation.
// Allocation always returns the smallest available ID.
// Not thread-safe; callers provide their own locking.
template <typename T> struct id_allocator {
  private:
	struct node {
		T lb;
		T ub;

		friend bool operator<(const node &u, const node &v) { return u.lb < v.lb; }
	};

  public:
	id_allocator(T lb = 1, T ub = std::numeric_limits<T>::max()) { _nodes.insert(node{lb, ub}); }

	std::optional<T> allocate() {
		if (_nodes.empty())
			return std::nullopt;
		auto it = _nodes.begin();
		auto id = it->lb;
		if (it->lb < it->ub)
			_nodes.insert(std::next(it), node{static_cast<T>(it->lb + 1), it->ub});
		_nodes.erase(it);
		return id;
	}

	void free(T id) {
		// Merge with the neighbouring ranges so that the set stays small
		// when IDs are allocated and freed in bulk.
		node n{id, id};
		auto next = _nodes.lower_bound(n);
		assert(next == _nodes.end() || next->lb > id);
		if (next != _nodes.end() && next->lb == id + 1) {
			n.ub = next->ub;
			next = _nodes.erase(next);
		}
		if (next != _nodes.begin()) {
			auto prev = std::prev(next);
			assert(prev->ub < id);
			if (prev->ub + 1 == id) {
				n.lb = prev->lb;
				_nodes.erase(prev);
			}
		}
		_nodes.insert(n);
	}

  private:
	std::set<node> _nodes;
};

} // namespace corten
