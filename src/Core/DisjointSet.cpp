#include "DisjointSet.hpp"

#include <cstddef>
#include <utility>

DisjointSet::DisjointSet(int count)
	: parent(static_cast<std::size_t>(count)),
	  rank(static_cast<std::size_t>(count), 0),
	  sets(count) {
	for (int i = 0; i < count; ++i) {
		parent[i] = i;
	}
}

int DisjointSet::find(int x) {
	while (parent[x] != x) {
		parent[x] = parent[parent[x]];
		x = parent[x];
	}
	return x;
}

bool DisjointSet::unite(int a, int b) {
	a = find(a);
	b = find(b);
	if (a == b) {
		return false;
	}
	if (rank[a] < rank[b]) {
		std::swap(a, b);
	}
	parent[b] = a;
	if (rank[a] == rank[b]) {
		++rank[a];
	}
	--sets;
	return true;
}

int DisjointSet::setCount() const {
	return sets;
}
