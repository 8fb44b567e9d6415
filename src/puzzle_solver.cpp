#include "puzzle_solver.hpp"
#include "errors.hpp"
#include "hasher.hpp"
#include "metrics.hpp"
#include "pow_verifier.hpp"

#include <boost/asio/post.hpp>

namespace powshield {

PuzzleSolver::PuzzleSolver(PuzzleChallenge challenge, int difficulty, int max_retries, NonceSource nonce_source)
    : challenge_(std::move(challenge))
    , timestamp_(std::to_string(challenge_.timestamp))
    , difficulty_(difficulty)
    , max_attempts_(max_retries > 0 ? static_cast<int64_t>(max_retries) * ATTEMPTS_PER_SLICE : 0)
    , nonce_source_(nonce_source ? std::move(nonce_source) : NonceSource(&Hasher::random_token))
{}

PuzzleSolver::State PuzzleSolver::step() {
    State current = state_;
    if (current == State::SOLVED || current == State::EXHAUSTED || current == State::CANCELLED) {
        return current;
    }
    if (cancelled_) {
        state_ = State::CANCELLED;
        return State::CANCELLED;
    }
    state_ = State::SOLVING;

    int done = 0;
    while (done < ATTEMPTS_PER_SLICE && attempts_ < max_attempts_) {
        ++done;
        ++attempts_;
        std::string nonce = nonce_source_();
        std::string stamp = PoWVerifier::compute_stamp(challenge_.endpoint, timestamp_, nonce, challenge_.context);
        if (DifficultyChecker::satisfies(stamp, difficulty_)) {
            proof_ = PuzzleProof{timestamp_, std::move(nonce), challenge_.context, std::move(stamp)};
            state_ = State::SOLVED;
            break;
        }
    }
    MetricsRegistry::instance().increment_counter("solver_attempts_total", done);

    if (state_ == State::SOLVING && attempts_ >= max_attempts_) {
        state_ = State::EXHAUSTED;
    }
    return state_;
}

PuzzleProof PuzzleSolver::solve() {
    State s = step();
    while (s == State::SOLVING) {
        s = step();
    }
    if (s != State::SOLVED) {
        throw PuzzleExhaustedError(attempts_);
    }
    return *proof_;
}

void PuzzleSolver::async_solve(net::any_io_executor executor, CompletionHandler handler) {
    net::post(executor, [self = shared_from_this(), executor, handler = std::move(handler)]() mutable {
        self->run_slice(std::move(executor), std::move(handler));
    });
}

void PuzzleSolver::run_slice(net::any_io_executor executor, CompletionHandler handler) {
    State s = step();
    if (s == State::SOLVED) {
        handler(proof_);
        return;
    }
    if (s != State::SOLVING) {
        handler(std::nullopt);
        return;
    }
    // Yield: the next slice is queued behind whatever else is ready.
    net::post(executor, [self = shared_from_this(), executor, handler = std::move(handler)]() mutable {
        self->run_slice(std::move(executor), std::move(handler));
    });
}

}
