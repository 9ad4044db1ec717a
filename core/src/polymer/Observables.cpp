#include "polymer/Observables.h"
#include "polymer/Chain.h"
#include "utils/Validation.h"
#include <cstdint>

namespace {

// Running integer moments keep the gyration exact: with n nodes,
//   Rg^2 = (n*Sxx - Sx^2 + n*Syy - Sy^2) / n^2
struct Moments {
    std::int64_t n = 0;
    std::int64_t sx = 0, sy = 0;
    std::int64_t sxx = 0, syy = 0;

    void add(const Site& s) {
        ++n;
        sx += s.x;
        sy += s.y;
        sxx += static_cast<std::int64_t>(s.x) * s.x;
        syy += static_cast<std::int64_t>(s.y) * s.y;
    }

    double gyration() const {
        if (n <= 1) return 0.0;
        const std::int64_t num = (n * sxx - sx * sx) + (n * syy - sy * sy);
        return static_cast<double>(num) / static_cast<double>(n * n);
    }
};

template <typename NodeContainer>
Observables observablesOfNodes(const NodeContainer& nodes) {
    Observables out;
    if (nodes.size() < 2) {
        return out;
    }

    const std::size_t links = nodes.size() - 1;
    out.endToEnd.reserve(links);
    out.gyration.reserve(links);

    const Site& first = nodes.front();
    Moments moments;
    moments.add(first);

    auto it = nodes.begin();
    ++it;
    for (; it != nodes.end(); ++it) {
        const double dx = static_cast<double>(first.x - it->x);
        const double dy = static_cast<double>(first.y - it->y);
        out.endToEnd.push_back(dx * dx + dy * dy);

        moments.add(*it);
        out.gyration.push_back(moments.gyration());
    }

    validation::checkSeries(out.endToEnd.data(), out.endToEnd.size(), "endToEnd");
    validation::checkSeries(out.gyration.data(), out.gyration.size(), "gyration");
    return out;
}

}  // namespace

Observables computeObservables(const Chain& chain) {
    return observablesOfNodes(chain.nodes());
}

Observables computeObservables(const std::vector<Site>& nodes) {
    return observablesOfNodes(nodes);
}

Observables computeObservables(const std::deque<Site>& nodes) {
    return observablesOfNodes(nodes);
}

double gyrationOf(const std::vector<Site>& nodes, std::size_t count) {
    Moments moments;
    for (std::size_t i = 0; i < count && i < nodes.size(); ++i) {
        moments.add(nodes[i]);
    }
    return moments.gyration();
}

CentreOfMass centreOfMass(const std::vector<Site>& nodes, std::size_t count) {
    CentreOfMass cm;
    Moments moments;
    for (std::size_t i = 0; i < count && i < nodes.size(); ++i) {
        moments.add(nodes[i]);
    }
    if (moments.n > 0) {
        const double inv_n = 1.0 / static_cast<double>(moments.n);
        cm.x = static_cast<double>(moments.sx) * inv_n;
        cm.y = static_cast<double>(moments.sy) * inv_n;
    }
    return cm;
}

std::vector<double> rosenbluthWeights(const std::vector<int>& branchingFactors) {
    std::vector<double> weights;
    weights.reserve(branchingFactors.size());
    double w = 1.0;
    for (int m : branchingFactors) {
        w *= m;
        weights.push_back(w);
    }
    return weights;
}
