#include "polymer/Growth.h"
#include "polymer/Conflict.h"

Chain newChain(const Site& origin, std::mt19937_64& rng) {
    std::uniform_int_distribution<int> dirDist(0, kNumDirections - 1);
    return Chain(origin, kAllDirections[dirDist(rng)]);
}

int growStep(Chain& chain, Anchor from, std::mt19937_64& rng) {
    if (chain.pruned()) {
        return 0;
    }

    const auto options = validDirections(chain, from);
    const int m = static_cast<int>(options.size());
    if (m == 0) {
        chain.markDeadEnd();
        return 0;
    }

    std::uniform_int_distribution<int> pick(0, m - 1);
    chain.append(options[pick(rng)], from);
    return m;
}

int growTo(Chain& chain, int targetLength, std::mt19937_64& rng) {
    while (chain.length() < targetLength) {
        if (growStep(chain, Anchor::End, rng) == 0) {
            break;
        }
    }
    return chain.length();
}

std::vector<Site> freeWalk(const Site& origin, int length, std::mt19937_64& rng) {
    std::uniform_int_distribution<int> dirDist(0, kNumDirections - 1);
    std::vector<Site> nodes;
    nodes.reserve(length > 0 ? length + 1 : 1);
    nodes.push_back(origin);
    for (int i = 0; i < length; ++i) {
        nodes.push_back(step(nodes.back(), kAllDirections[dirDist(rng)]));
    }
    return nodes;
}
