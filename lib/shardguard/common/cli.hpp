#pragma once
/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <limits>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "logger.hpp"
#include "numeric-cast.hpp"

namespace shardguard::cli {
    using arguments = std::vector<std::string>;
    using options = std::map<std::string, std::optional<std::string>>;

    struct option_config {
        std::string desc {};
        std::optional<std::string> default_value {};

        option_config(std::string d, std::optional<std::string> def={}):
            desc { std::move(d) }, default_value { std::move(def) }
        {
        }
    };

    struct argument_config {
        void expect(const std::initializer_list<std::string> &names)
        {
            _names = names;
            _min = 0;
            _max = 0;
            for (const auto &n: _names) {
                if (n.starts_with('<'))
                    ++_min;
                if (n.find("...") != std::string::npos)
                    _max = std::numeric_limits<size_t>::max();
                else if (_max != std::numeric_limits<size_t>::max())
                    ++_max;
            }
        }

        [[nodiscard]] size_t min() const noexcept
        {
            return _min;
        }

        [[nodiscard]] size_t max() const noexcept
        {
            return _max;
        }

        [[nodiscard]] std::string usage() const;
    private:
        std::vector<std::string> _names {};
        size_t _min = 0;
        size_t _max = 0;
    };

    struct config {
        std::string name {};
        std::string desc {};
        argument_config args {};
        std::map<std::string, option_config> opts {};
    };

    struct command;
    using command_ptr = std::shared_ptr<command>;

    struct command {
        virtual ~command() = default;
        virtual void configure(config &cmd) const = 0;

        virtual void run(const arguments &args, const options &) const
        {
            run(args);
        }

        virtual void run(const arguments &) const
        {
            throw error("command does not implement the run method!");
        }

        static const command_ptr &reg(command_ptr cmd);
    };

    template<typename T>
    T from_str(const std::string &str)
    {
        size_t end = 0;
        unsigned long long val = 0;
        try {
            val = std::stoull(str, &end, 10);
        } catch (const std::exception &ex) {
            throw error(fmt::format("failed to parse {} from '{}'", typeid(T).name(), str), ex);
        }
        if (end != str.size()) [[unlikely]]
            throw error(fmt::format("failed to parse {} from '{}'", typeid(T).name(), str));
        return numeric_cast<T>(val);
    }

    extern int run(int argc, const char **argv);
}
