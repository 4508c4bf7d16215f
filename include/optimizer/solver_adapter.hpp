// SPDX-License-Identifier: MIT
/**
 * @file solver_adapter.hpp
 * @brief Backend selection and dispatch
 *
 * The adapter owns a registry of backends keyed by name. A solve request
 * names a backend explicitly or asks for "auto", in which case the
 * program's class is looked up in DefaultSolverMap. An optional fallback
 * backend retries a solve that timed out or failed numerically; it is
 * never used unless configured.
 */

#pragma once

#include "optimizer/solver_backend.hpp"

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace convexfolio
{
    namespace optimizer
    {

        /**
         * @struct DefaultSolverMap
         * @brief Backend used for each problem class when the choice is "auto"
         */
        struct DefaultSolverMap
        {
            std::string lp = "osqp";
            std::string qp = "osqp";
            std::string socp = "scs";

            const std::string &backend_for(ProblemClass problem_class) const;
        };

        /**
         * @struct SolverAdapterConfig
         * @brief Everything the adapter needs besides the registry
         */
        struct SolverAdapterConfig
        {
            DefaultSolverMap defaults;
            SolverOptions options;
            std::string fallback_backend; ///< Empty disables the retry
        };

        /**
         * @class SolverAdapter
         * @brief Resolves a backend for a program and runs it
         *
         * Usage Example:
         * @code
         * SolverAdapter adapter;                // osqp and scs registered
         * SolverResult r = adapter.solve(program, "auto");
         * std::cout << r.solver_name << ": " << to_string(r.status) << "\n";
         * @endcode
         */
        class SolverAdapter
        {
        public:
            static constexpr const char *AUTO = "auto";

            /**
             * @brief Construct with the built-in backends (osqp, scs) registered
             * @throws ValidationError if the default map or fallback names an
             *         unregistered backend
             */
            explicit SolverAdapter(const SolverAdapterConfig &config = SolverAdapterConfig());

            /**
             * @brief Add or replace a backend under its name()
             */
            void register_backend(std::shared_ptr<const SolverBackend> backend);

            bool has_backend(const std::string &name) const;
            std::vector<std::string> backend_names() const;

            /**
             * @brief Backend that would run a program of this class
             * @param problem_class Program class
             * @param solver_choice "auto" or a backend name
             * @throws ValidationError for an unknown backend name
             * @throws UnsupportedProblemClass if the backend cannot express the class
             */
            const SolverBackend &resolve(ProblemClass problem_class,
                                         const std::string &solver_choice) const;

            /**
             * @brief Solve a program
             *
             * Resolution errors are thrown before any solver runs. Solver
             * failures come back as a status; the result names the backend
             * that produced it, which is the fallback when a retry happened.
             */
            SolverResult solve(const CanonicalProgram &program,
                               const std::string &solver_choice = AUTO) const;

            const SolverAdapterConfig &config() const { return config_; }
            void set_options(const SolverOptions &options) { config_.options = options; }

        private:
            SolverAdapterConfig config_;
            std::map<std::string, std::shared_ptr<const SolverBackend>> backends_;

            const SolverBackend &lookup(const std::string &name) const;
        };

    } // namespace optimizer
} // namespace convexfolio
