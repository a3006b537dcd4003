#ifndef POKER_ODDS_ODDS_SESSION_H
#define POKER_ODDS_ODDS_SESSION_H

#include "poker_odds/odds_engine.h"
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <thread>
#include <utility>

namespace poker_odds {

/**
 * Couche session entre l'interface et le moteur.
 *
 * Chaque déclencheur (changement de carte, de pot, tick périodique) capture
 * les entrées courantes, les numérote et relance un calcul sur un thread de
 * travail unique. Une seule requête est en cours à la fois : une requête plus
 * récente remplace celle en attente et annule celle en cours (Monte Carlo
 * vérifie le drapeau entre deux essais). Un résultat n'est publié que si son
 * numéro est toujours le dernier émis.
 *
 * Une exception levée par le callback de publication est capturée sur le
 * thread de travail et exposée par last_error().
 */
class OddsSession {
public:
    using ResultCallback = std::function<void(const OddsResult&)>;
    // Calcul d'une requête ; par défaut OddsEngine::compute avec la configuration de la session.
    using Calculator = std::function<OddsResult(const OddsRequest&, std::mt19937&, const std::atomic<bool>*)>;

    // Entrées initiales : As Ks, board vide, pot 100.
    explicit OddsSession(EngineConfig config = {}, ResultCallback on_result = {}, Calculator calculator = {});
    ~OddsSession();

    OddsSession(const OddsSession&) = delete;
    OddsSession& operator=(const OddsSession&) = delete;

    // Déclencheurs ; chacun renvoie le numéro de la requête émise.
    uint64_t set_hole_cards(Card first, Card second);
    // slot 0..4, std::nullopt pour vider l'emplacement ; std::out_of_range sinon
    uint64_t set_community_card(std::size_t slot, std::optional<Card> card);
    uint64_t set_pot_text(const std::string& text);
    uint64_t tick();
    uint64_t request_recompute();

    std::optional<OddsResult> latest_result() const;
    // Message de la dernière requête en échec (DuplicateCardError...), vidé au succès suivant
    std::optional<std::string> last_error() const;
    uint64_t latest_sequence() const;
    OddsRequest current_inputs() const;

    // Bloque jusqu'à ce qu'aucun calcul ne soit en attente ni en cours.
    void wait_until_idle();

private:
    uint64_t submit_locked();
    void worker_loop();

    OddsEngine engine_;
    ResultCallback on_result_;
    Calculator calculator_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable idle_cv_;

    OddsRequest inputs_;
    std::optional<std::pair<uint64_t, OddsRequest>> pending_;
    uint64_t last_sequence_ = 0;
    bool busy_ = false;
    bool stopping_ = false;
    std::atomic<bool> cancel_current_{false};

    std::optional<OddsResult> latest_result_;
    std::optional<std::string> last_error_;
    std::mt19937 seed_rng_;

    std::thread worker_; // dernier membre : démarré une fois le reste construit
};

} // namespace poker_odds

#endif // POKER_ODDS_ODDS_SESSION_H
