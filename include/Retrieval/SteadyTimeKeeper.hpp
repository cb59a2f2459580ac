#ifndef RETRIEVAL_STEADY_TIME_KEEPER_HPP
#define RETRIEVAL_STEADY_TIME_KEEPER_HPP

/**
 * @file SteadyTimeKeeper.hpp
 *
 * This module declares the Retrieval::SteadyTimeKeeper class.
 *
 * © 2018 by Richard Walters
 */

#include "TimeKeeper.hpp"

#include <chrono>

namespace Retrieval {

    /**
     * This is the production implementation of Retrieval::TimeKeeper,
     * measuring time with a monotonic clock.
     */
    class SteadyTimeKeeper
        : public TimeKeeper
    {
    public:
        // Retrieval::TimeKeeper

        virtual double GetCurrentTime() override {
            return std::chrono::duration_cast< std::chrono::duration< double > >(
                std::chrono::steady_clock::now().time_since_epoch()
            ).count();
        }
    };

}

#endif /* RETRIEVAL_STEADY_TIME_KEEPER_HPP */
