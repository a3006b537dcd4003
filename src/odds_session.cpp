#include "poker_odds/odds_session.h"
#include "eval/exact_enumerator.hpp" // NUM_BOARD_CARDS
#include "poker_odds/errors.h"
#include "poker_odds/game_utils.hpp"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace poker_odds {

namespace {
std::mt19937 make_seed_rng(const EngineConfig& config) {
    if (config.seed.has_value()) {
        return std::mt19937(*config.seed);
    }
    std::random_device rd;
    return std::mt19937(rd());
}
} // namespace

OddsSession::OddsSession(EngineConfig config, ResultCallback on_result, Calculator calculator)
    : engine_(config),
      on_result_(std::move(on_result)),
      calculator_(std::move(calculator)),
      seed_rng_(make_seed_rng(config))
{
    if (!calculator_) {
        calculator_ = [this](const OddsRequest& request, std::mt19937& rng, const std::atomic<bool>* cancel) {
            return engine_.compute(request, rng, cancel);
        };
    }
    inputs_.hole_cards = {make_card(Rank::ACE, Suit::SPADES), make_card(Rank::KING, Suit::SPADES)};
    inputs_.community.assign(NUM_BOARD_CARDS, std::nullopt);
    inputs_.pot_size = 100.0;
    worker_ = std::thread(&OddsSession::worker_loop, this);
}

OddsSession::~OddsSession() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        cancel_current_.store(true);
    }
    work_cv_.notify_all();
    if (worker_.joinable()) {
        worker_.join();
    }
}

uint64_t OddsSession::set_hole_cards(Card first, Card second) {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_.hole_cards = {first, second};
    return submit_locked();
}

uint64_t OddsSession::set_community_card(std::size_t slot, std::optional<Card> card) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (slot >= inputs_.community.size()) {
        throw std::out_of_range("Community slot out of range: " + std::to_string(slot));
    }
    inputs_.community[slot] = card;
    return submit_locked();
}

uint64_t OddsSession::set_pot_text(const std::string& text) {
    std::lock_guard<std::mutex> lock(mutex_);
    inputs_.pot_size = parse_pot_size(text);
    return submit_locked();
}

uint64_t OddsSession::tick() {
    std::lock_guard<std::mutex> lock(mutex_);
    return submit_locked();
}

uint64_t OddsSession::request_recompute() {
    std::lock_guard<std::mutex> lock(mutex_);
    return submit_locked();
}

uint64_t OddsSession::submit_locked() {
    const uint64_t sequence = ++last_sequence_;
    if (pending_.has_value()) {
        spdlog::debug("Session : requête #{} remplacée par #{}.", pending_->first, sequence);
    }
    pending_ = std::make_pair(sequence, inputs_);
    if (busy_) {
        // Le calcul en cours est devenu obsolète
        cancel_current_.store(true);
    }
    spdlog::trace("Session : requête #{} board {} pot {}.", sequence,
                  slots_to_string(inputs_.community), inputs_.pot_size);
    work_cv_.notify_one();
    return sequence;
}

void OddsSession::worker_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        work_cv_.wait(lock, [this] { return stopping_ || pending_.has_value(); });
        if (stopping_) break;

        auto [sequence, request] = std::move(*pending_);
        pending_.reset();
        busy_ = true;
        cancel_current_.store(false);
        std::mt19937 rng(seed_rng_());
        lock.unlock();

        std::optional<OddsResult> result;
        std::optional<std::string> error;
        try {
            result = calculator_(request, rng, &cancel_current_);
            result->sequence = sequence;
        } catch (const ComputationCancelled&) {
            spdlog::debug("Session : requête #{} annulée.", sequence);
        } catch (const std::exception& e) {
            error = e.what();
        }

        lock.lock();
        const bool is_latest = (sequence == last_sequence_);
        if (!is_latest && (result || error)) {
            spdlog::debug("Session : résultat #{} obsolète (dernier #{}), ignoré.", sequence, last_sequence_);
        } else if (error) {
            spdlog::error("Session : requête #{} en échec : {}", sequence, *error);
            last_error_ = error;
        } else if (result) {
            latest_result_ = result;
            last_error_.reset();
            if (on_result_) {
                // Callback hors verrou : il peut relire la session
                lock.unlock();
                std::optional<std::string> callback_error;
                try {
                    on_result_(*result);
                } catch (const std::exception& e) {
                    callback_error = e.what();
                }
                lock.lock();
                if (callback_error) {
                    spdlog::error("Session : publication #{} en échec : {}", sequence, *callback_error);
                    last_error_ = callback_error;
                }
            }
        }
        busy_ = false;
        idle_cv_.notify_all();
    }
}

std::optional<OddsResult> OddsSession::latest_result() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return latest_result_;
}

std::optional<std::string> OddsSession::last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

uint64_t OddsSession::latest_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}

OddsRequest OddsSession::current_inputs() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inputs_;
}

void OddsSession::wait_until_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return !busy_ && !pending_.has_value(); });
}

} // namespace poker_odds
