//
// Created by malikt on 8/20/25.
//

#ifndef DUEL_RECORDINGPLAYSTYLE_HPP
#define DUEL_RECORDINGPLAYSTYLE_HPP

#include <memory>
#include <utility>

#include "../core/Battle.hpp"
#include "../core/Playstyle.hpp"

namespace duel::core::debug
{
    class RecordingPlaystyle final : public Playstyle
    {
    public:
        explicit RecordingPlaystyle(PlaystyleUP inner)
            : Playstyle(inner->Queue()), inner_{std::move(inner)}
        {
        }

        auto SelectAction() -> Action override
        {
            last_action_ = inner_->SelectAction();
            has_last_ = true;
            return last_action_;
        }

        auto HasLast() const -> bool
        {
            return has_last_;
        }

        auto Last() const -> Action
        {
            return last_action_;
        }

    private:
        PlaystyleUP inner_;
        Action last_action_{Action::NoAction};
        bool has_last_{false};
    };

    // Wraps every playstyle a factory makes
    inline auto WrapRecording(PlaystyleFactory inner) -> PlaystyleFactory
    {
        return [inner = std::move(inner)](PlyrIdxT const seat, TurnQueue& queue) -> PlaystyleUP
        {
            return std::make_unique<RecordingPlaystyle>(inner(seat, queue));
        };
    }

    // Downcast helper (only safe if you used WrapRecording at construction)
    inline auto AsRecording(Playstyle* p) -> RecordingPlaystyle*
    {
        return dynamic_cast<RecordingPlaystyle*>(p);
    }
} // namespace duel::core::debug

#endif //DUEL_RECORDINGPLAYSTYLE_HPP
