#include "bot/draws.hpp"
#include "core/bitboard.hpp"
#include <algorithm>
#include <array>
#include <bit>

namespace hu_poker {

namespace {

constexpr int MAX_OUTS = 15;

// Masque de rangs avec l'As aussi en bit 1 (roue). Bit v = rang v.
unsigned straight_mask(const std::vector<Card>& cards) {
    unsigned mask = 0;
    for (Card c : cards) {
        const int v = rank_value(c);
        mask |= 1u << v;
        if (v == 14) mask |= 1u << 1;
    }
    return mask;
}

double street_factor(Street street) {
    switch (street) {
        case Street::FLOP: return 1.0;
        case Street::TURN: return 0.5;
        default:           return 0.0;
    }
}

void detect_flush_draws(const std::vector<Card>& hole_cards, const std::vector<Card>& board, DrawInfo& info) {
    const Bitboard hole_bb = cards_to_board(hole_cards);
    const Bitboard board_bb = cards_to_board(board);
    for (int s = 0; s < NUM_SUITS; ++s) {
        const Suit suit = static_cast<Suit>(s);
        const int hole_count = std::popcount(static_cast<unsigned>(suit_rank_mask(hole_bb, suit)));
        if (hole_count == 0) continue;
        const int total = hole_count + std::popcount(static_cast<unsigned>(suit_rank_mask(board_bb, suit)));
        // total >= 5 : couleur déjà faite
        if (total == 4) {
            info.flush_draw = true;
        } else if (total == 3 && board.size() == 3) {
            info.backdoor_flush = true;
        }
    }
}

void detect_straight_draws(const std::vector<Card>& hole_cards, const std::vector<Card>& board, DrawInfo& info) {
    std::vector<Card> all(hole_cards);
    all.insert(all.end(), board.begin(), board.end());
    const unsigned all_mask = straight_mask(all);
    const unsigned hole_mask = straight_mask(hole_cards);

    // Fenêtres de 5 rangs consécutifs : A-5 .. T-A
    for (int base = 1; base <= 10; ++base) {
        const unsigned window = 0x1Fu << base;
        if (!(hole_mask & window)) continue;
        const int present = std::popcount(all_mask & window);
        if (present == 5) continue; // quinte faite

        if (present == 4) {
            const int gap = std::countr_zero(window & ~all_mask);
            bool open_ended = false;
            if (gap == base) {
                open_ended = base + 5 <= 14;  // rien au-dessus de l'As
            } else if (gap == base + 4) {
                open_ended = base >= 2;       // rien sous l'As bas
            }
            if (open_ended) info.oesd = true;
            else info.gutshot = true;
        } else if (present == 3 && board.size() == 3) {
            info.backdoor_straight = true;
        }
    }
}

} // namespace

int DrawInfo::outs() const {
    int n = 0;
    if (flush_draw) n += 9;
    if (oesd) n += 8;
    else if (gutshot) n += 4;
    return std::min(n, MAX_OUTS);
}

double DrawInfo::equity(Street street) const {
    switch (street) {
        case Street::FLOP: return outs() * 0.04;
        case Street::TURN: return outs() * 0.02;
        default:           return 0.0;
    }
}

double DrawInfo::strength_boost(Street street) const {
    const double f = street_factor(street);
    double boost = 0.5 * equity(street);
    boost += overcards * 0.04 * f;
    if (backdoor_flush) boost += 0.03 * f;
    if (backdoor_straight) boost += 0.02 * f;
    return boost;
}

DrawInfo detect_draws(const std::vector<Card>& hole_cards, const std::vector<Card>& board) {
    DrawInfo info;
    if (board.empty()) return info;

    detect_flush_draws(hole_cards, board, info);
    detect_straight_draws(hole_cards, board, info);

    int max_board_rank = 0;
    for (Card c : board) max_board_rank = std::max(max_board_rank, rank_value(c));
    for (Card c : hole_cards) {
        if (rank_value(c) > max_board_rank) ++info.overcards;
    }
    return info;
}

BoardTexture analyze_board_texture(const std::vector<Card>& board) {
    if (board.empty()) return BoardTexture::DRY;

    int wetness = 0;

    // Concentration de couleur
    std::array<int, NUM_SUITS> suit_counts{};
    for (Card c : board) suit_counts[static_cast<int>(get_suit(c))]++;
    const int max_suit = *std::max_element(suit_counts.begin(), suit_counts.end());
    if (max_suit >= 3) wetness += 2;
    else if (max_suit == 2) wetness += 1;

    // Connectivité : rangs voisins (écart <= 2)
    std::vector<int> ranks;
    for (Card c : board) ranks.push_back(rank_value(c));
    std::sort(ranks.begin(), ranks.end());
    bool paired = false;
    for (size_t i = 1; i < ranks.size(); ++i) {
        if (ranks[i] - ranks[i - 1] <= 2) ++wetness;
        if (ranks[i] == ranks[i - 1]) paired = true;
    }
    if (paired) ++wetness;

    if (wetness <= 1) return BoardTexture::DRY;
    if (wetness <= 3) return BoardTexture::MEDIUM;
    return BoardTexture::WET;
}

std::string texture_to_string(BoardTexture texture) {
    switch (texture) {
        case BoardTexture::DRY:    return "Dry";
        case BoardTexture::MEDIUM: return "Medium";
        case BoardTexture::WET:    return "Wet";
    }
    return "Unknown";
}

} // namespace hu_poker
