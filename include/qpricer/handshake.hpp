#pragma once

namespace qpricer {

// Callee side of the start/busy/done handshake. busy is a level, done is a
// pulse on the tick the result is ready, valid qualifies done.
struct UnitStatus {
    bool busy = false;
    bool done = false;
    bool valid = false;
};

constexpr bool rising_edge(bool previous, bool current) {
    return current && !previous;
}

// Previous-value register for edge detection on a level input.
class EdgeDetector {
public:
    // Returns true on the tick where the input goes from low to high.
    bool sample(bool current) {
        const bool edge = rising_edge(previous_, current);
        previous_ = current;
        return edge;
    }

    void reset() { previous_ = false; }

private:
    bool previous_ = false;
};

} // namespace qpricer
