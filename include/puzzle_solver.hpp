#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <boost/asio/any_io_executor.hpp>

#include "challenge.hpp"

namespace net = boost::asio;

namespace powshield {

/**
 * Client-side proof-of-work search.
 *
 * READY -> SOLVING -> SOLVED | EXHAUSTED (or CANCELLED when abandoned).
 * Work is done in slices of ATTEMPTS_PER_SLICE attempts; between slices the
 * async variant posts itself back to the executor so that other handlers on
 * the same io_context get to run. State is kept across slices.
 */
class PuzzleSolver : public std::enable_shared_from_this<PuzzleSolver> {
public:
    enum class State {
        READY,
        SOLVING,
        SOLVED,
        EXHAUSTED,
        CANCELLED
    };

    static constexpr int ATTEMPTS_PER_SLICE = 100;

    using NonceSource = std::function<std::string()>;
    // Receives the proof, or std::nullopt when exhausted or cancelled.
    using CompletionHandler = std::function<void(std::optional<PuzzleProof>)>;

    PuzzleSolver(PuzzleChallenge challenge, int difficulty, int max_retries,
                 NonceSource nonce_source = NonceSource());

    // Runs at most one slice. Returns the resulting state.
    State step();

    // Blocking search. Throws PuzzleExhaustedError when the attempt budget runs out.
    PuzzleProof solve();

    // Cooperative search on the executor. The solver must be owned by a shared_ptr.
    void async_solve(net::any_io_executor executor, CompletionHandler handler);

    // Takes effect at the next slice boundary.
    void cancel() { cancelled_ = true; }

    State state() const { return state_; }
    int64_t attempts() const { return attempts_; }
    int64_t max_attempts() const { return max_attempts_; }
    const std::optional<PuzzleProof>& proof() const { return proof_; }

private:
    void run_slice(net::any_io_executor executor, CompletionHandler handler);

    PuzzleChallenge challenge_;
    std::string timestamp_;
    int difficulty_;
    int64_t max_attempts_;
    NonceSource nonce_source_;

    std::atomic<State> state_{State::READY};
    std::atomic<bool> cancelled_{false};
    std::atomic<int64_t> attempts_{0};
    std::optional<PuzzleProof> proof_;
};

}
