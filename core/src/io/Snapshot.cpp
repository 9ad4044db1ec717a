#include "io/Snapshot.h"
#include <sstream>
#include <iomanip>
#include <algorithm>

std::string chainToJson(const Chain& chain, bool includeNodes) {
    std::ostringstream os;
    os << std::setprecision(17);

    os << "{";
    os << "\"length\":" << chain.length() << ",";
    os << "\"pruned\":" << (chain.pruned() ? "true" : "false") << ",";
    os << "\"deadEnd\":" << (chain.deadEnd() ? "true" : "false") << ",";
    os << "\"origin\":[" << chain.origin().x << "," << chain.origin().y << "],";

    os << "\"directions\":[";
    const auto& links = chain.links();
    for (std::size_t i = 0; i < links.size(); ++i) {
        os << "\"" << directionName(links[i].direction()) << "\"";
        if (i + 1 < links.size()) os << ",";
    }
    os << "],";

    os << "\"branchingFactors\":[";
    const auto& m = chain.branchingFactors();
    for (std::size_t i = 0; i < m.size(); ++i) {
        os << m[i];
        if (i + 1 < m.size()) os << ",";
    }
    os << "],";

    os << "\"weights\":[";
    const auto& w = chain.weights();
    for (std::size_t i = 0; i < w.size(); ++i) {
        os << w[i];
        if (i + 1 < w.size()) os << ",";
    }
    os << "]";

    if (includeNodes) {
        os << ",\"nodes\":[";
        const auto& nodes = chain.nodes();
        for (std::size_t i = 0; i < nodes.size(); ++i) {
            os << "[" << nodes[i].x << "," << nodes[i].y << "]";
            if (i + 1 < nodes.size()) os << ",";
        }
        os << "]";
    }

    os << "}";
    return os.str();
}

void logRoundStats(const std::vector<RoundStats>& rounds, std::ostream& out) {
    out << "round,length,population,grown,dead_ends,discarded,doubled,enriched,mean_weight\n";
    for (const auto& s : rounds) {
        out << s.round << ","
            << s.chainLength << ","
            << s.population << ","
            << s.grown << ","
            << s.deadEnds << ","
            << s.discarded << ","
            << s.doubled << ","
            << s.enriched << ","
            << s.meanWeight << "\n";
    }
}

void logAverages(const WeightedAverage& endToEnd, const WeightedAverage& gyration, std::ostream& out) {
    out << "length,end_to_end,end_to_end_err,gyration,gyration_err,effective_samples\n";
    const std::size_t n = std::min(endToEnd.mean.size(), gyration.mean.size());
    for (std::size_t i = 0; i < n; ++i) {
        out << (i + 1) << ","
            << endToEnd.mean[i] << ","
            << endToEnd.error[i] << ","
            << gyration.mean[i] << ","
            << gyration.error[i] << ","
            << endToEnd.effectiveSamples[i] << "\n";
    }
}
