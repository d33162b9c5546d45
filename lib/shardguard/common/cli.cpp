/* This file is part of ShardGuard project
 * Copyright (c) 2025 R2 Rationality OÜ (info at r2rationality dot com) */

#include <iostream>
#include "cli.hpp"

namespace shardguard::cli {
    namespace {
        struct registered_t {
            command_ptr cmd;
            config cfg;
        };
        using registry_t = std::map<std::string, registered_t>;

        registry_t &registry()
        {
            static registry_t reg {};
            return reg;
        }

        void print_help(const std::string_view prog)
        {
            std::cerr << fmt::format("usage: {} <command> [<arg> ...] [--<option> <value> ...]\n", prog);
            std::cerr << "commands:\n";
            for (const auto &[name, reg]: registry()) {
                std::cerr << fmt::format("    {} {}\n", name, reg.cfg.args.usage());
                std::cerr << fmt::format("        {}\n", reg.cfg.desc);
                for (const auto &[opt_name, opt]: reg.cfg.opts) {
                    if (opt.default_value)
                        std::cerr << fmt::format("        --{}: {} (default: {})\n", opt_name, opt.desc, *opt.default_value);
                    else
                        std::cerr << fmt::format("        --{}: {}\n", opt_name, opt.desc);
                }
            }
        }

        void parse(const registered_t &reg, const int argc, const char **argv, arguments &args, options &opts)
        {
            for (const auto &[name, opt]: reg.cfg.opts)
                opts.try_emplace(name, opt.default_value);
            for (int i = 2; i < argc; ++i) {
                const std::string_view arg { argv[i] };
                if (arg.starts_with("--")) {
                    const std::string name { arg.substr(2) };
                    const auto it = opts.find(name);
                    if (it == opts.end()) [[unlikely]]
                        throw error(fmt::format("unsupported option: --{}", name));
                    if (i + 1 >= argc) [[unlikely]]
                        throw error(fmt::format("option --{} requires a value", name));
                    it->second.emplace(argv[++i]);
                } else {
                    args.emplace_back(arg);
                }
            }
            if (args.size() < reg.cfg.args.min() || args.size() > reg.cfg.args.max()) [[unlikely]]
                throw error(fmt::format("command {} expects arguments: {}", reg.cfg.name, reg.cfg.args.usage()));
        }
    }

    std::string argument_config::usage() const
    {
        std::string res {};
        for (const auto &n: _names) {
            if (!res.empty())
                res += ' ';
            res += n;
        }
        return res;
    }

    const command_ptr &command::reg(command_ptr cmd)
    {
        config cfg {};
        cmd->configure(cfg);
        if (cfg.name.empty()) [[unlikely]]
            throw error("a command must have a name!");
        auto [it, created] = registry().try_emplace(cfg.name, registered_t { std::move(cmd), std::move(cfg) });
        if (!created) [[unlikely]]
            throw error(fmt::format("duplicate command name: {}", it->first));
        return it->second.cmd;
    }

    int run(const int argc, const char **argv)
    {
        const std::string_view prog { argc > 0 ? argv[0] : "shardguard" };
        if (argc < 2) {
            print_help(prog);
            return 1;
        }
        const auto it = registry().find(argv[1]);
        if (it == registry().end()) {
            std::cerr << fmt::format("unknown command: {}\n", argv[1]);
            print_help(prog);
            return 1;
        }
        const auto ex = logger::run_log_errors([&] {
            arguments args {};
            options opts {};
            parse(it->second, argc, argv, args, opts);
            it->second.cmd->run(args, opts);
        });
        return ex ? 1 : 0;
    }
}
