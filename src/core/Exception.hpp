//
// Created by Malik T on 14/08/2025.
//

#ifndef DUEL_EXCEPTION_HPP
#define DUEL_EXCEPTION_HPP

#include "OmegaException.hpp"

#include <expected>
#include <format>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include "Types.hpp"
#include "Actions.hpp"

namespace duel::core::error
{
    enum class Code : unsigned
    {
        Unknown, // unknown error
        EmptyQueue, // remove() on a queue without live tickets
        InvariantViolation, // queue/search state that cannot happen without a logic defect
        InvalidAction, // character asked to perform an action it cannot take
        Config, // bad command line / battle configuration
        Assertion // internal assertion failed
    };

    struct UnknownError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct EmptyQueueError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvariantError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct InvalidActionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct ConfigError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    struct AssertionError : public OmegaException<Code>
    {
        using OmegaException<Code>::OmegaException;
    };

    [[noreturn]]
    inline auto fail(Code c, std::string msg) -> void
    {
        switch (c)
        {
        case Code::Unknown: throw UnknownError(std::move(msg), c);
        case Code::EmptyQueue: throw EmptyQueueError(std::move(msg), c);
        case Code::InvariantViolation: throw InvariantError(std::move(msg), c);
        case Code::InvalidAction: throw InvalidActionError(std::move(msg), c);
        case Code::Config: throw ConfigError(std::move(msg), c);
        case Code::Assertion: throw AssertionError(std::move(msg), c);
        }
        throw std::runtime_error(msg);
    }

#define DUEL_THROW(code_enum, msg) ::duel::core::error::fail((code_enum), (msg))
#define DUEL_ASSERT(cond, msg) do { if(!(cond)) ::duel::core::error::fail(::duel::core::error::Code::Assertion, (msg)); } while(0)

    // Reasons a playstyle's choice is refused by the battle driver.
    enum class ActionViolationCode : std::uint16_t
    {
        Battle_Over,
        Battle_NoActor,
        Action_NoneSelected,
        Action_Unavailable
    };

    struct ActionViolation
    {
        ActionViolationCode code{};
        std::optional<Action> action{};
        std::optional<std::string> actor{};
        std::optional<int> sp{};

        auto with_action(Action a) -> ActionViolation&
        {
            action = a;
            return *this;
        }

        auto with_actor(std::string name) -> ActionViolation&
        {
            actor = std::move(name);
            return *this;
        }

        auto with_sp(int v) -> ActionViolation&
        {
            sp = v;
            return *this;
        }
    };

    inline auto to_string(ActionViolationCode c) -> std::string_view
    {
        using E = ActionViolationCode;
        switch (c)
        {
        case E::Battle_Over: return "Battle is already over";
        case E::Battle_NoActor: return "No actor at the front of the queue";
        case E::Action_NoneSelected: return "Playstyle selected no action";
        case E::Action_Unavailable: return "Action not available to actor";
        }
        return "Unknown";
    }

    inline auto describe(ActionViolation const& v) -> std::string
    {
        auto s = std::format("{}", to_string(v.code));
        if (v.actor) s += std::format(" | actor={}", *v.actor);
        if (v.action) s += std::format(" | action={}",
                                       (*v.action == Action::Attack
                                            ? "A"
                                            : (*v.action == Action::Special ? "S" : "X")));
        if (v.sp) s += std::format(" | sp={}", *v.sp);
        return s;
    }

    using ValidateResult = std::expected<void, ActionViolation>;
}

#endif //DUEL_EXCEPTION_HPP
