#ifndef RETRIEVAL_TIME_KEEPER_HPP
#define RETRIEVAL_TIME_KEEPER_HPP

/**
 * @file TimeKeeper.hpp
 *
 * This module declares the Retrieval::TimeKeeper interface.
 *
 * © 2018 by Richard Walters
 */

namespace Retrieval {

    /**
     * This represents the time-keeping requirements of Retrieval::Session.
     * To integrate Retrieval::Session into a larger program, implement this
     * interface in terms of the actual time.
     */
    class TimeKeeper {
    public:
        // Methods

        virtual ~TimeKeeper() = default;

        /**
         * This method returns the current time, in seconds.
         *
         * @return
         *     The current time is returned, in seconds.
         */
        virtual double GetCurrentTime() = 0;
    };

}

#endif /* RETRIEVAL_TIME_KEEPER_HPP */
