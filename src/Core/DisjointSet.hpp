#ifndef DISJOINTSET_HPP
#define DISJOINTSET_HPP

#include <vector>

class DisjointSet {
public:
	explicit DisjointSet(int count);

	int find(int x);
	bool unite(int a, int b);
	int setCount() const;

private:
	std::vector<int> parent;
	std::vector<int> rank;
	int sets;
};

#endif
