// tests/fakes/fake_command_runner.cpp
#include "fakes/fake_command_runner.hpp"

#include <algorithm>

namespace apguard
{
    namespace fakes
    {

        namespace
        {
            const std::set<std::string> BUILTIN_CHAINS = {"INPUT", "OUTPUT", "FORWARD", "PREROUTING", "POSTROUTING"};

            infrastructure::CommandResult exit_with(int code, const std::string &output = "")
            {
                infrastructure::CommandResult result;
                result.exit_code = code;
                result.output = output;
                return result;
            }

            std::string join(std::vector<std::string>::const_iterator begin, std::vector<std::string>::const_iterator end)
            {
                std::string out;
                for (auto it = begin; it != end; ++it)
                {
                    if (!out.empty())
                        out += " ";
                    out += *it;
                }
                return out;
            }

            std::string value_after(const std::vector<std::string> &argv, const std::string &key)
            {
                auto it = std::find(argv.begin(), argv.end(), key);
                if (it == argv.end() || std::next(it) == argv.end())
                    return "";
                return *std::next(it);
            }
        } // namespace

        infrastructure::CommandResult ok_result(const std::string &output)
        {
            return exit_with(0, output);
        }

        bool FakeCommandRunner::contains(const std::vector<std::string> &argv, const std::vector<std::string> &pattern)
        {
            if (pattern.empty())
                return true;
            return std::search(argv.begin(), argv.end(), pattern.begin(), pattern.end()) != argv.end();
        }

        infrastructure::CommandResult FakeCommandRunner::run(const std::vector<std::string> &argv,
                                                             std::chrono::milliseconds)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.push_back(argv);

            for (auto it = scripts_.rbegin(); it != scripts_.rend(); ++it)
            {
                if (contains(argv, it->pattern))
                    return it->result;
            }
            return simulate(argv);
        }

        void FakeCommandRunner::respond(const std::vector<std::string> &pattern, infrastructure::CommandResult result)
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scripts_.push_back({pattern, result});
        }

        void FakeCommandRunner::fail(const std::vector<std::string> &pattern, int exit_code, const std::string &output)
        {
            respond(pattern, exit_with(exit_code, output));
        }

        void FakeCommandRunner::time_out(const std::vector<std::string> &pattern)
        {
            infrastructure::CommandResult result;
            result.timed_out = true;
            respond(pattern, result);
        }

        void FakeCommandRunner::clear_scripts()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            scripts_.clear();
        }

        std::vector<std::vector<std::string>> FakeCommandRunner::calls() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return calls_;
        }

        size_t FakeCommandRunner::count(const std::vector<std::string> &pattern) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            return static_cast<size_t>(std::count_if(calls_.begin(), calls_.end(),
                                                     [&](const std::vector<std::string> &call)
                                                     { return contains(call, pattern); }));
        }

        int FakeCommandRunner::first_index(const std::vector<std::string> &pattern) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            for (size_t i = 0; i < calls_.size(); ++i)
            {
                if (contains(calls_[i], pattern))
                    return static_cast<int>(i);
            }
            return -1;
        }

        void FakeCommandRunner::clear_calls()
        {
            std::lock_guard<std::mutex> lock(mutex_);
            calls_.clear();
        }

        bool FakeCommandRunner::chain_exists(const std::string &table, const std::string &chain) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (BUILTIN_CHAINS.count(chain))
                return true;
            auto t = tables_.find(table);
            return t != tables_.end() && t->second.count(chain) > 0;
        }

        std::vector<std::string> FakeCommandRunner::rules(const std::string &table, const std::string &chain) const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto t = tables_.find(table);
            if (t == tables_.end())
                return {};
            auto c = t->second.find(chain);
            return c == t->second.end() ? std::vector<std::string>{} : c->second;
        }

        std::vector<std::string> FakeCommandRunner::user_chains() const
        {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<std::string> chains;
            for (const auto &table : tables_)
            {
                for (const auto &chain : table.second)
                {
                    if (!BUILTIN_CHAINS.count(chain.first))
                        chains.push_back(table.first + ":" + chain.first);
                }
            }
            return chains;
        }

        infrastructure::CommandResult FakeCommandRunner::simulate(const std::vector<std::string> &argv)
        {
            if (argv.empty())
                return exit_with(127);
            if (argv[0] == "nmcli")
                return simulate_nmcli(argv);
            if (argv[0] == "iptables")
                return simulate_iptables(argv);
            if (argv[0] == "sysctl")
                return simulate_sysctl(argv);
            return exit_with(0);
        }

        infrastructure::CommandResult FakeCommandRunner::simulate_nmcli(const std::vector<std::string> &argv)
        {
            if (contains(argv, {"-f", "RUNNING", "general"}))
            {
                return exit_with(0, network_manager_running ? "running\n" : "asleep\n");
            }
            if (contains(argv, {"connection", "add"}))
            {
                const std::string name = value_after(argv, "con-name");
                if (connections.count(name))
                    return exit_with(1, "Error: connection already exists");
                connections.insert(name);
                return exit_with(0);
            }
            if (contains(argv, {"connection", "show", "--active"}))
            {
                std::string out;
                for (const auto &name : active_connections)
                    out += name + "\n";
                return exit_with(0, out);
            }
            if (contains(argv, {"connection", "show"}))
            {
                const std::string name = value_after(argv, "show");
                return connections.count(name) ? exit_with(0, "connection.id: " + name) : exit_with(10);
            }
            if (contains(argv, {"connection", "up"}))
            {
                const std::string name = value_after(argv, "up");
                if (!connections.count(name))
                    return exit_with(10);
                active_connections.insert(name);
                return exit_with(0);
            }
            if (contains(argv, {"connection", "down"}))
            {
                const std::string name = value_after(argv, "down");
                if (!active_connections.count(name))
                    return exit_with(10);
                active_connections.erase(name);
                return exit_with(0);
            }
            if (contains(argv, {"connection", "delete"}))
            {
                const std::string name = value_after(argv, "delete");
                if (!connections.count(name))
                    return exit_with(10);
                connections.erase(name);
                active_connections.erase(name);
                return exit_with(0);
            }
            return exit_with(0);
        }

        infrastructure::CommandResult FakeCommandRunner::simulate_iptables(const std::vector<std::string> &argv)
        {
            const std::string table = value_after(argv, "-t").empty() ? "filter" : value_after(argv, "-t");
            auto &chains = tables_[table];

            // Locate the operation
            auto op = std::find_if(argv.begin(), argv.end(), [](const std::string &arg)
                                   { return arg == "-N" || arg == "-F" || arg == "-X" || arg == "-L" ||
                                            arg == "-A" || arg == "-I" || arg == "-C" || arg == "-D"; });
            if (op == argv.end() || std::next(op) == argv.end())
                return exit_with(2, "bad command");

            const std::string verb = *op;
            const std::string chain = *std::next(op);
            auto rest = std::next(op, 2);
            const bool exists = BUILTIN_CHAINS.count(chain) || chains.count(chain);

            if (verb == "-N")
            {
                if (exists)
                    return exit_with(1, "Chain already exists.");
                chains[chain];
                return exit_with(0);
            }
            if (!exists)
                return exit_with(1, "No chain/target/match by that name.");

            if (verb == "-L")
                return exit_with(0);
            if (verb == "-F")
            {
                chains[chain].clear();
                return exit_with(0);
            }
            if (verb == "-X")
            {
                for (const auto &entry : chains)
                {
                    for (const auto &rule : entry.second)
                    {
                        if (rule.find("-j " + chain) != std::string::npos)
                            return exit_with(1, "Too many links.");
                    }
                }
                chains.erase(chain);
                return exit_with(0);
            }
            if (verb == "-I" && rest != argv.end() && *rest == "1")
            {
                ++rest;
            }

            const std::string rule = join(rest, argv.end());
            auto &list = chains[chain];
            auto found = std::find(list.begin(), list.end(), rule);

            if (verb == "-A")
                list.push_back(rule);
            else if (verb == "-I")
                list.insert(list.begin(), rule);
            else if (verb == "-C")
                return exit_with(found != list.end() ? 0 : 1);
            else if (verb == "-D")
            {
                if (found == list.end())
                    return exit_with(1, "Bad rule (does a matching rule exist in that chain?).");
                list.erase(found);
            }
            return exit_with(0);
        }

        infrastructure::CommandResult FakeCommandRunner::simulate_sysctl(const std::vector<std::string> &argv)
        {
            if (contains(argv, {"-n", "net.ipv4.ip_forward"}))
                return exit_with(0, ip_forward + "\n");
            const std::string assignment = value_after(argv, "-w");
            const std::string key = "net.ipv4.ip_forward=";
            if (assignment.compare(0, key.size(), key) == 0)
            {
                ip_forward = assignment.substr(key.size());
                return exit_with(0);
            }
            return exit_with(0);
        }

    } // namespace fakes
} // namespace apguard
