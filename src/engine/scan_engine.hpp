#pragma once

#include <atomic>
#include <stdexcept>
#include "reclaim/types.hpp"

namespace reclaim::engine {

    class DigestIndex;

    /**
     * @brief Raised when a scan cannot even begin (no accessible root, no threads).
     */
    class ScanError : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Runs Traverser -> Deduplicator -> (HashEngine) into one ScanResult.
     *
     * Subtree and per-file I/O errors end up in ScanResult::warnings and never
     * abort the scan.
     */
    class ScanEngine {
    public:
        enum class State {
            Idle,
            Traversing,
            Deduplicating,
            Hashing,
            Complete
        };

        explicit ScanEngine(DigestIndex* index = nullptr);

        /**
         * @brief Scans the configured roots (or $HOME when none are given).
         * @throws ScanError if no root can be walked.
         */
        ScanResult scan(const ScanConfig& config);

        State state() const { return m_state.load(); }

    private:
        DigestIndex* m_index;
        std::atomic<State> m_state{State::Idle};
    };

    const char* to_string(ScanEngine::State state);

}
