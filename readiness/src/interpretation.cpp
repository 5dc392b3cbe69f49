#include "interpretation.hpp"
#include <fmt/format.h>

namespace {

// Rows follow TrendState codes 1-9, columns follow VolatilityTier
const InterpretationCell kMatrix[9][3] = {
    // 1 Super-compensation / peaking
    {
        {"Ideal peaking",
         "Adaptation is very stable and performance should be highly repeatable. "
         "A state to go into a race with confidence."},
        {"Good peaking",
         "Readiness is high and rising, with day-to-day swings in the normal range. "
         "Planned performance can be expected."},
        {"Unstable peak",
         "The score is high but daily swings are large, so the condition may be fragile. "
         "Allow for the peak not holding or for a dip on race day."},
    },
    // 2 Stable adaptation
    {
        {"True stability",
         "A sustainable good form. Strong evidence that the current training load is appropriate."},
        {"Standard stability",
         "High readiness is being maintained. Some daily variation is within the normal response."},
        {"Apparent stability",
         "The average is high but the condition is unsettled and could break down at any time. "
         "Look into stressors outside training."},
    },
    // 3 Early fatigue / taper
    {
        {"Planned decline",
         "Load is high but the body responds consistently, possibly the early part of a planned taper. "
         "Watch for the decline continuing."},
        {"Typical early fatigue",
         "The score is falling with normal daily variation, a typical sign of accumulating fatigue. "
         "Monitor and adjust load."},
        {"Dangerous decline",
         "The score is falling and daily swings are large, suggesting rapid maladaptation. "
         "The risk of non-functional overreaching is very high and immediate action is needed."},
    },
    // 4 Productive rebound
    {
        {"Reliable recovery",
         "Recovery is steady and adaptation is progressing well. "
         "A good time to bring training load back gradually."},
        {"Standard recovery",
         "Recovering well from fatigue; daily variation is part of a normal recovery. "
         "Load can return as planned."},
        {"Unsteady recovery",
         "Trending toward recovery but the process is unstable. "
         "Check for anything hindering recovery and restore load more cautiously."},
    },
    // 5 Balanced
    {
        {"Stable baseline",
         "Steady, for better or worse. Suitable for continuing base training."},
        {"Typical balance",
         "Standard readiness with standard variation. Training load and recovery are in balance."},
        {"Latent instability",
         "Balanced on average but the daily condition is swinging. "
         "Factors outside training may be involved, or the load may be slightly off."},
    },
    // 6 Functional overreaching
    {
        {"Planned overload",
         "The body is under stress but copes in a consistent way. "
         "A quality overload from which super-compensation can follow."},
        {"Standard overload",
         "A normal response to planned overload. The body is stressed but coping within the usual range."},
        {"Risk of turning non-functional",
         "A warning sign that load exceeds the capacity to adapt. "
         "Consider reducing load or adding recovery immediately."},
    },
    // 7 Recovery in progress
    {
        {"Steady recovery",
         "The low point has passed and recovery is on a stable path. A good sign; keep recovering."},
        {"Early recovery",
         "On the way back with some remaining variation. A normal process; keep avoiding high intensity."},
        {"Fragile early recovery",
         "Recovery has started but is very unstable and a little extra stress could reverse it. "
         "Put full recovery first."},
    },
    // 8 Stagnant fatigue
    {
        {"Chronic fatigue / deadlock",
         "Recovery has stalled and settled at a low level. "
         "A fundamental review of the training stimulus or an extended rest may be needed."},
        {"Standard stagnation",
         "Readiness stays low. Focus on finding and removing what is blocking recovery."},
        {"Obstructed recovery",
         "The drive to recover is fighting ongoing stressors such as illness or life load. "
         "Investigate factors outside training thoroughly."},
    },
    // 9 Acute maladaptation / high risk
    {
        {"Consistent deterioration",
         "Rare at low volatility: the body is steadily getting worse, a very dangerous state "
         "that may point to overtraining syndrome."},
        {"Ongoing deterioration",
         "Readiness is low and still falling with normal variation, a clear negative trend. "
         "Training needs to be cut substantially."},
        {"Uncontrolled deterioration",
         "The score is low, falling and swinging widely; homeostasis has been lost. "
         "Stop training and consult a professional."},
    },
};

std::string signed_pct(double value) {
    return fmt::format("{}{:.1f}%", value > 0 ? "+" : "", value);
}

std::string tier_label(VolatilityTier tier) {
    switch (tier) {
        case VolatilityTier::Low: return "low variation";
        case VolatilityTier::Moderate: return "moderate variation";
        case VolatilityTier::High: return "high variation";
    }
    return "moderate variation";
}

} // namespace

ScoreLevel TrendInterpreter::level_for(double score, const TrendConfig& config) {
    if (score >= config.high_level) return ScoreLevel::High;
    if (score >= config.medium_level) return ScoreLevel::Medium;
    return ScoreLevel::Low;
}

MomentumCategory TrendInterpreter::categorize(double momentum, const TrendConfig& config) {
    if (momentum >= config.positive) return MomentumCategory::Positive;
    if (momentum > config.negative) return MomentumCategory::Neutral;
    return MomentumCategory::Negative;
}

MomentumStrength TrendInterpreter::strength(double momentum, const TrendConfig& config) {
    if (momentum > config.strong_positive) return MomentumStrength::StrongPositive;
    if (momentum >= config.positive) return MomentumStrength::Positive;
    if (momentum < config.strong_negative) return MomentumStrength::StrongNegative;
    if (momentum <= config.negative) return MomentumStrength::Negative;
    return MomentumStrength::Neutral;
}

TrendState TrendInterpreter::classify(ScoreLevel level, MomentumCategory momentum) {
    int row = level == ScoreLevel::High ? 0 : level == ScoreLevel::Medium ? 1 : 2;
    int col = momentum == MomentumCategory::Positive ? 0
            : momentum == MomentumCategory::Neutral ? 1 : 2;
    return static_cast<TrendState>(row * 3 + col + 1);
}

std::string TrendInterpreter::state_label(TrendState state) {
    switch (state) {
        case TrendState::Peaking: return "Super-compensation/peaking";
        case TrendState::StableAdaptation: return "Stable adaptation";
        case TrendState::EarlyFatigue: return "Early fatigue/taper";
        case TrendState::ProductiveRebound: return "Productive rebound";
        case TrendState::Balanced: return "Balanced";
        case TrendState::FunctionalOverreaching: return "Functional overreaching";
        case TrendState::RecoveryInProgress: return "Recovery in progress";
        case TrendState::StagnantFatigue: return "Stagnant fatigue";
        case TrendState::AcuteMaladaptation: return "Acute maladaptation/high risk";
    }
    return "Balanced";
}

std::string TrendInterpreter::state_key(TrendState state) {
    static const char* kKeys[9] = {
        "HIGH_POSITIVE", "HIGH_NEUTRAL", "HIGH_NEGATIVE",
        "MEDIUM_POSITIVE", "MEDIUM_NEUTRAL", "MEDIUM_NEGATIVE",
        "LOW_POSITIVE", "LOW_NEUTRAL", "LOW_NEGATIVE"
    };
    int code = state_code(state);
    if (code < 1 || code > 9) return "MEDIUM_NEUTRAL";
    return kKeys[code - 1];
}

std::optional<InterpretationCell> TrendInterpreter::lookup(TrendState state, VolatilityTier tier) {
    int code = state_code(state);
    int col = static_cast<int>(tier);
    if (code < 1 || code > 9 || col < 0 || col > 2) return std::nullopt;

    const InterpretationCell& cell = kMatrix[code - 1][col];
    if (!cell.assessment || !cell.detail) return std::nullopt;
    return cell;
}

std::string TrendInterpreter::interpret(double score, double momentum, double volatility,
                                        VolatilityTier tier, TrendState state,
                                        const TrendConfig& config) {
    auto cell = lookup(state, tier);
    if (!cell) {
        return fallback(score, momentum, volatility, config);
    }

    std::string text = fmt::format("[{}] State: {}.\n{}",
                                   cell->assessment, state_label(state), cell->detail);

    if (tier == VolatilityTier::High) {
        text += fmt::format(" Volatility is significantly high ({:.1f}).", volatility);
    } else if (tier == VolatilityTier::Low) {
        text += fmt::format(" Volatility is significantly low and stable ({:.1f}).", volatility);
    }

    text += fmt::format("\n\nReadiness score: {:.1f}\nMomentum ({}-day): {}\nVolatility: {:.1f} ({})",
                        score, config.lookback_days, signed_pct(momentum),
                        volatility, tier_label(tier));
    text += "\n\nRecommended action: " + recommended_action(score, momentum, tier, config);
    return text;
}

std::string TrendInterpreter::fallback(double score, double momentum, double volatility,
                                       const TrendConfig& config) {
    std::string assessment;
    if (score >= 85) assessment = "Excellent readiness";
    else if (score >= 70) assessment = "Good readiness";
    else if (score >= 55) assessment = "Moderate readiness";
    else if (score >= 45) assessment = "Low readiness";
    else assessment = "Very low readiness";

    std::string direction;
    if (momentum > config.strong_positive) direction = "Readiness is improving strongly.";
    else if (momentum >= config.positive) direction = "Readiness is improving gradually.";
    else if (momentum < config.strong_negative) direction = "Readiness is falling quickly.";
    else if (momentum <= config.negative) direction = "Readiness is declining gradually.";
    else direction = "Readiness is stable.";

    std::string variation;
    if (volatility > 10) variation = "Daily swings are large and the condition is unsettled.";
    else if (volatility > 5) variation = "There is a moderate amount of daily variation.";
    else variation = "Daily variation is small and steady.";

    return fmt::format("[{}]\n{}\n{}\nReadiness score: {:.1f}, momentum {}, volatility {:.1f}.",
                       assessment, direction, variation, score, signed_pct(momentum), volatility);
}

std::string TrendInterpreter::recommended_action(double score, double momentum, VolatilityTier tier,
                                                 const TrendConfig& config) {
    if (score >= config.high_level) {
        if (tier == VolatilityTier::Low) {
            return "Ideal for high-intensity work. Train as planned or above the planned load.";
        }
        if (tier == VolatilityTier::High) {
            return "Readiness is high but swinging. Keep the intensity while paying attention to recovery.";
        }
        return "Good condition. Carry out the planned training.";
    }

    if (score >= config.medium_level) {
        if (momentum >= config.positive) {
            return "Recovering. Continue at moderate intensity and bring load back step by step.";
        }
        if (momentum <= config.negative) {
            return "Fatigue may be building. Hold intensity back and put recovery first.";
        }
        return "Normal training is fine, but watch how the body responds.";
    }

    if (score >= 45) {
        if (momentum >= config.positive) {
            return "Recovery under way. Stay at low to moderate intensity and keep recovering.";
        }
        return "Prioritise active recovery. Limit sessions to light aerobic work or stretching.";
    }

    return "Full rest or very light activity only. Consult a professional if needed.";
}

std::string TrendInterpreter::insufficient_data(int points, int required) {
    return fmt::format("Insufficient data for trend analysis: {} scored days available, "
                       "at least {} are required.", points, required);
}

std::string to_string(ScoreLevel level) {
    switch (level) {
        case ScoreLevel::Low: return "LOW";
        case ScoreLevel::Medium: return "MEDIUM";
        case ScoreLevel::High: return "HIGH";
    }
    return "MEDIUM";
}

std::string to_string(MomentumCategory category) {
    switch (category) {
        case MomentumCategory::Positive: return "POSITIVE";
        case MomentumCategory::Neutral: return "NEUTRAL";
        case MomentumCategory::Negative: return "NEGATIVE";
    }
    return "NEUTRAL";
}

std::string to_string(MomentumStrength strength) {
    switch (strength) {
        case MomentumStrength::StrongPositive: return "STRONG_POSITIVE";
        case MomentumStrength::Positive: return "POSITIVE";
        case MomentumStrength::Neutral: return "NEUTRAL";
        case MomentumStrength::Negative: return "NEGATIVE";
        case MomentumStrength::StrongNegative: return "STRONG_NEGATIVE";
    }
    return "NEUTRAL";
}

std::string to_string(VolatilityTier tier) {
    switch (tier) {
        case VolatilityTier::Low: return "LOW";
        case VolatilityTier::Moderate: return "MODERATE";
        case VolatilityTier::High: return "HIGH";
    }
    return "MODERATE";
}

std::string to_string(Confidence confidence) {
    switch (confidence) {
        case Confidence::Low: return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High: return "high";
    }
    return "low";
}

std::string readiness_level_description(double score) {
    if (score >= 85) return "Excellent - Peak performance ready";
    if (score >= 70) return "Good - Ready for hard training";
    if (score >= 55) return "Moderate - Normal training appropriate";
    if (score >= 45) return "Poor - Recovery focus recommended";
    return "Very poor - Rest recommended";
}
