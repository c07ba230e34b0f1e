#ifndef CONFIG_HPP
#define CONFIG_HPP

// ============================================================================
// NAVIGATION TUNING
// ============================================================================

struct NavigatorConfig {
    // Runaway-loop safety net, not a performance target
    int maxSteps = 10000;

    // Score bonus for a neighbour that has never been occupied
    int unvisitedBias = 100;

    // Keep exploring until this share of cells has been visited
    double exploreCoverage = 0.9;
    // ...unless standing on a goal with more than this share visited
    double goalCoverage = 0.7;

    // Simulator cell colours
    char startColor     = 'G';
    char goalColor      = 'R';
    char exploringColor = 'B';
    char speedRunColor  = 'Y';
    char completeColor  = 'G';
};

#endif // CONFIG_HPP
