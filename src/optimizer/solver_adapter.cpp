// SPDX-License-Identifier: MIT
/**
 * @file solver_adapter.cpp
 * @brief Implementation of backend selection and dispatch
 */

#include "optimizer/solver_adapter.hpp"
#include "optimizer/osqp_backend.hpp"
#include "optimizer/scs_backend.hpp"

#include <iostream>

namespace convexfolio
{
    namespace optimizer
    {

        const std::string &DefaultSolverMap::backend_for(ProblemClass problem_class) const
        {
            switch (problem_class)
            {
            case ProblemClass::LP:
                return lp;
            case ProblemClass::QP:
                return qp;
            case ProblemClass::SOCP:
                return socp;
            }
            return socp;
        }

        SolverAdapter::SolverAdapter(const SolverAdapterConfig &config) : config_(config)
        {
            register_backend(std::make_shared<OSQPBackend>());
            register_backend(std::make_shared<SCSBackend>());

            for (const auto *name : {&config_.defaults.lp, &config_.defaults.qp, &config_.defaults.socp})
            {
                lookup(*name);
            }

            if (!config_.fallback_backend.empty())
            {
                lookup(config_.fallback_backend);
            }
        }

        void SolverAdapter::register_backend(std::shared_ptr<const SolverBackend> backend)
        {
            if (!backend)
            {
                throw std::invalid_argument("Cannot register a null solver backend");
            }
            const std::string name = backend->name();
            backends_[name] = std::move(backend);
        }

        bool SolverAdapter::has_backend(const std::string &name) const
        {
            return backends_.count(name) > 0;
        }

        std::vector<std::string> SolverAdapter::backend_names() const
        {
            std::vector<std::string> names;
            for (const auto &entry : backends_)
            {
                names.push_back(entry.first);
            }
            return names;
        }

        const SolverBackend &SolverAdapter::lookup(const std::string &name) const
        {
            auto it = backends_.find(name);
            if (it == backends_.end())
            {
                std::string known;
                for (const auto &entry : backends_)
                {
                    known += (known.empty() ? "" : ", ") + entry.first;
                }
                throw ValidationError("Unknown solver backend: '" + name + "'. Registered: " + known);
            }
            return *it->second;
        }

        const SolverBackend &SolverAdapter::resolve(ProblemClass problem_class,
                                                    const std::string &solver_choice) const
        {
            const std::string &name = (solver_choice.empty() || solver_choice == AUTO)
                                          ? config_.defaults.backend_for(problem_class)
                                          : solver_choice;

            const SolverBackend &backend = lookup(name);
            if (!backend.supports(problem_class))
            {
                throw UnsupportedProblemClass(
                    "Solver backend '" + name + "' cannot solve " + to_string(problem_class) + " programs");
            }
            return backend;
        }

        SolverResult SolverAdapter::solve(const CanonicalProgram &program,
                                          const std::string &solver_choice) const
        {
            const SolverBackend &backend = resolve(program.problem_class, solver_choice);
            SolverResult result = backend.solve(program, config_.options);

            const bool retryable = result.status == SolverStatus::TIMEOUT ||
                                   result.status == SolverStatus::NUMERICAL_FAILURE;

            if (retryable && !config_.fallback_backend.empty() &&
                config_.fallback_backend != backend.name())
            {
                const SolverBackend &fallback = lookup(config_.fallback_backend);
                if (fallback.supports(program.problem_class))
                {
                    std::cerr << "Warning: " << backend.name() << " returned "
                              << to_string(result.status) << " (" << result.message
                              << "), retrying with " << fallback.name() << "\n";
                    result = fallback.solve(program, config_.options);
                }
            }

            return result;
        }

    } // namespace optimizer
} // namespace convexfolio
