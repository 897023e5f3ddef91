#pragma once

namespace trustnet {

struct AnalysisConfig {
    double weak_link_threshold = 0.3;   // strictly below → weak link
    int high_impact_closure    = 10;    // closure larger than this → high severity
    int max_expansions         = 100000;
    double max_seconds         = 5.0;
};

} // namespace trustnet
