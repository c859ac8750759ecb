#pragma once

#include <algorithm>
#include <map>
#include <random>
#include <string>
#include <vector>

#include "tests/TestConfig.h"
#include "tests/TestValidator.h"
#include "booking/BookingOrchestrator.h"
#include "booking/ReservationIndex.h"
#include "booking/SeatPool.h"
#include "booking/WaitlistQueue.h"
#include "session/CommandParser.h"

namespace Test {
    /**
     * Direct checks on the data structures, below the session layer.
     * Each check returns a self-contained TestResult.
     */
    namespace StructureChecks {
        namespace detail {
            inline bool sameEntries(const std::vector<ReservationIndex::Entry> &actual,
                                    const std::map<int32_t, int32_t> &expected) {
                if (actual.size() != expected.size()) return false;
                auto it = expected.begin();
                for (const auto &entry : actual) {
                    if (entry.userId != it->first || entry.seatId != it->second) return false;
                    ++it;
                }
                return true;
            }

            inline void verifyTree(const ReservationIndex &index, TestResult &result, const std::string &context) {
                ++result.invariantChecks;
                std::string reason;
                if (!index.verifyStructure(reason)) {
                    result.addFailure(context + ": " + reason);
                }
            }
        }

        /**
         * Random insert/remove against std::map, tree shape checked after each step
         */
        inline TestResult reservationIndexRandomOps() {
            TestResult result{"Unit_ReservationIndexRandomOps"};
            ReservationIndex index;
            std::map<int32_t, int32_t> reference;
            std::mt19937 rng{12};
            std::uniform_int_distribution<int32_t> userDist{1, 300};
            std::uniform_int_distribution<int> opDist{0, 2};

            for (uint32_t step = 0; step < 3000 && result.passed; ++step) {
                const int32_t user = userDist(rng);
                const std::string context = "step " + std::to_string(step);
                ++result.operationsExecuted;

                if (opDist(rng) != 0) {
                    if (reference.count(user) == 0) {
                        const int32_t seat = static_cast<int32_t>(step) + 1;
                        index.insert(user, seat);
                        reference[user] = seat;
                    }
                } else {
                    const bool removed = index.remove(user);
                    result.expect(removed == (reference.erase(user) == 1),
                                  context + ": remove(" + std::to_string(user) + ") disagrees with reference");
                }

                const auto found = index.search(user);
                const auto ref = reference.find(user);
                result.expect(found.has_value() == (ref != reference.end()) &&
                              (!found || *found == ref->second),
                              context + ": search(" + std::to_string(user) + ") disagrees with reference");
                result.expect(index.size() == reference.size(), context + ": size mismatch");
                detail::verifyTree(index, result, context);
            }

            result.expect(detail::sameEntries(index.allEntries(), reference), "in-order walk differs from reference");

            std::map<int32_t, int32_t> window(reference.lower_bound(50), reference.upper_bound(120));
            result.expect(detail::sameEntries(index.entriesInRange(50, 120), window),
                          "entriesInRange(50, 120) differs from reference");
            result.expect(index.entriesInRange(120, 50).empty(), "inverted range must be empty");

            const auto bySeat = index.entriesBySeat();
            result.expect(std::is_sorted(bySeat.begin(), bySeat.end(),
                                         [](const ReservationIndex::Entry &a, const ReservationIndex::Entry &b) {
                                             return a.seatId < b.seatId;
                                         }),
                          "entriesBySeat not ordered by seat");

            result.expect(!index.search(1000).has_value(), "absent user found");
            result.expect(!index.remove(1000), "remove of absent user reported success");

            index.clear();
            result.expect(index.empty() && index.allEntries().empty(), "clear left entries behind");
            return result;
        }

        /**
         * Sorted inserts must stay balanced; black height bounds depth
         */
        inline TestResult reservationIndexAscendingInserts() {
            TestResult result{"Unit_ReservationIndexAscending"};
            ReservationIndex index;
            constexpr int32_t count = 1024;

            for (int32_t user = 1; user <= count; ++user) {
                index.insert(user, count + 1 - user);
                ++result.operationsExecuted;
            }
            detail::verifyTree(index, result, "after ascending inserts");
            // 2^bh - 1 <= n and height <= 2*bh
            result.expect(index.blackHeight() >= 1 && index.blackHeight() <= 11,
                          "black height " + std::to_string(index.blackHeight()) + " out of bounds for 1024 nodes");

            for (int32_t user = 1; user <= count; user += 2) {
                result.expect(index.remove(user), "remove(" + std::to_string(user) + ") failed");
                ++result.operationsExecuted;
            }
            detail::verifyTree(index, result, "after removing odd users");
            result.expect(index.size() == count / 2, "size after removals");
            result.expect(index.search(512) == std::optional<int32_t>{count + 1 - 512}, "search(512) wrong seat");

            // Freed slots are reused
            for (int32_t user = 1; user <= count; user += 2) {
                index.insert(user, user);
            }
            detail::verifyTree(index, result, "after reinserting odd users");
            result.expect(index.size() == count, "size after reinsert");
            return result;
        }

        /**
         * Priority order, arrival tie-break, remove and update semantics
         */
        inline TestResult waitlistOrdering() {
            TestResult result{"Unit_WaitlistOrdering"};
            WaitlistQueue queue;
            queue.insert(1, 5);
            queue.insert(2, 9);
            queue.insert(3, 9);

            std::vector<int32_t> order;
            while (auto top = queue.extractTop()) {
                order.push_back(top->userId);
            }
            result.expect(order == std::vector<int32_t>{2, 3, 1}, "expected extraction order 2, 3, 1");
            result.expect(!queue.extractTop().has_value() && queue.top() == nullptr, "empty queue yields nothing");

            queue.insert(10, 4);
            queue.insert(11, 4);
            queue.insert(12, 1);
            const std::vector<WaitlistEntry> before = queue.entries();
            result.expect(!queue.remove(99), "remove of absent user reported success");
            result.expect(!queue.updatePriority(99, 7), "update of absent user reported success");
            const std::vector<WaitlistEntry> &after = queue.entries();
            bool unchanged = before.size() == after.size();
            for (size_t i = 0; unchanged && i < before.size(); ++i) {
                unchanged = before[i].userId == after[i].userId && before[i].priority == after[i].priority &&
                            before[i].sequence == after[i].sequence;
            }
            result.expect(unchanged, "absent-user edits changed the heap");

            const uint64_t sequence = queue.find(12)->sequence;
            result.expect(queue.updatePriority(12, 4), "update of waiting user failed");
            result.expect(queue.find(12)->sequence == sequence && queue.find(12)->priority == 4,
                          "update must keep the arrival sequence");
            result.expect(queue.remove(10) && !queue.contains(10), "remove of waiting user failed");

            order.clear();
            while (auto top = queue.extractTop()) {
                order.push_back(top->userId);
            }
            result.expect(order == std::vector<int32_t>{11, 12}, "expected 11 then 12 after edits");
            result.operationsExecuted = 12;
            return result;
        }

        /**
         * Random inserts, removes and updates against a sorted reference
         */
        inline TestResult waitlistRandomOps() {
            TestResult result{"Unit_WaitlistRandomOps"};
            WaitlistQueue queue;
            std::vector<WaitlistEntry> reference;
            std::mt19937 rng{7};
            std::uniform_int_distribution<int32_t> userDist{1, 200};
            std::uniform_int_distribution<int32_t> priorityDist{0, 6};
            std::uniform_int_distribution<int> opDist{0, 3};
            uint64_t sequence = 0;

            auto findRef = [&](int32_t user) {
                return std::find_if(reference.begin(), reference.end(),
                                    [user](const WaitlistEntry &e) { return e.userId == user; });
            };

            for (uint32_t step = 0; step < 2000; ++step) {
                const int32_t user = userDist(rng);
                const int32_t priority = priorityDist(rng);
                auto ref = findRef(user);
                ++result.operationsExecuted;

                switch (opDist(rng)) {
                    case 0:
                    case 1:
                        if (ref == reference.end()) {
                            queue.insert(user, priority);
                            reference.emplace_back(user, priority, sequence++);
                        }
                        break;
                    case 2:
                        result.expect(queue.remove(user) == (ref != reference.end()), "remove disagrees");
                        if (ref != reference.end()) reference.erase(ref);
                        break;
                    default:
                        result.expect(queue.updatePriority(user, priority) == (ref != reference.end()),
                                      "updatePriority disagrees");
                        if (ref != reference.end()) ref->priority = priority;
                        break;
                }
            }

            std::sort(reference.begin(), reference.end(), WaitlistQueue::hasHigherPriority);
            result.expect(queue.size() == reference.size(), "size mismatch with reference");
            for (const WaitlistEntry &expected : reference) {
                auto top = queue.extractTop();
                if (!result.expect(top.has_value() && top->userId == expected.userId,
                                   "extraction order differs at user " + std::to_string(expected.userId))) {
                    break;
                }
            }
            result.expect(queue.isEmpty(), "queue not drained");
            return result;
        }

        inline TestResult seatPoolOrdering() {
            TestResult result{"Unit_SeatPoolOrdering"};
            SeatPool pool;
            result.expect(!pool.extractMin().has_value(), "empty pool returned a seat");

            for (int32_t seat : {7, 3, 9, 1, 4, 8, 2}) {
                pool.insert(seat);
            }
            std::vector<int32_t> order;
            while (auto seat = pool.extractMin()) {
                order.push_back(*seat);
            }
            result.expect(order == std::vector<int32_t>{1, 2, 3, 4, 7, 8, 9}, "seats not extracted ascending");
            result.expect(pool.isEmpty(), "pool not drained");
            result.operationsExecuted = 15;
            return result;
        }

        /**
         * Every verb parses with its arity; malformed lines are errors, blanks are skipped
         */
        inline TestResult commandParsing() {
            TestResult result{"Unit_CommandParsing"};

            struct Case {
                const char *line;
                CommandType type;
                int32_t first;
                int32_t second;
            };
            const Case valid[] = {
                {"Initialize(5)", CommandType::INITIALIZE, 5, 0},
                {"Available()", CommandType::AVAILABLE, 0, 0},
                {"Reserve(1, 1)", CommandType::RESERVE, 1, 1},
                {"Cancel(3,7)", CommandType::CANCEL, 3, 7},
                {"ExitWaitlist(4)", CommandType::EXIT_WAITLIST, 4, 0},
                {"UpdatePriority( 4 , -2 )", CommandType::UPDATE_PRIORITY, 4, -2},
                {"AddSeats(10)", CommandType::ADD_SEATS, 10, 0},
                {"PrintReservations()", CommandType::PRINT_RESERVATIONS, 0, 0},
                {"ReleaseSeats(2, 9)", CommandType::RELEASE_SEATS, 2, 9},
                {"  Quit()\r", CommandType::QUIT, 0, 0},
            };
            for (const Case &c : valid) {
                ++result.operationsExecuted;
                const ParseResult parsed = CommandParser::parse(c.line);
                if (!result.expect(parsed.ok(), std::string("should parse: ") + c.line + " (" + parsed.error + ")")) {
                    continue;
                }
                result.expect(parsed.command.type == c.type && parsed.command.args[0] == c.first &&
                              parsed.command.args[1] == c.second,
                              std::string("wrong command for: ") + c.line);
            }

            const char *invalid[] = {
                "Reserve(1)", "Reserve(1, 2, 3)", "Initialize()", "Available(1)",
                "Initialize(abc)", "Initialize(5", "Initialize5)", "Initialize((5))",
                "initialize(5)", "Reserve(1,)", "AddSeats(99999999999)", "Cancel(1 2)",
            };
            for (const char *line : invalid) {
                ++result.operationsExecuted;
                result.expect(CommandParser::parse(line).status == ParseResult::Status::ERROR,
                              std::string("should be rejected: ") + line);
            }

            result.expect(CommandParser::parse("").status == ParseResult::Status::BLANK, "empty line not blank");
            result.expect(CommandParser::parse(" \t\r").status == ParseResult::Status::BLANK,
                          "whitespace line not blank");
            result.expect(std::string(CommandParser::verbName(CommandType::RELEASE_SEATS)) == "ReleaseSeats",
                          "verbName(RELEASE_SEATS)");
            return result;
        }

        /**
         * Reserve then cancel hands the seat back to the pool; absent exits change nothing
         */
        inline TestResult orchestratorRoundTrips() {
            TestResult result{"Unit_OrchestratorRoundTrips"};
            BookingOrchestrator engine;

            result.expect(!engine.isInitialized() && engine.available().availableSeats == 0,
                          "fresh engine must be uninitialized with no seats");
            result.expect(engine.reserve(1, 1).outcome == BookingOutcome::WAITLISTED,
                          "reserve before Initialize should waitlist");
            result.expect(engine.initialize(3).ok() && engine.isInitialized() && engine.waitlist().isEmpty(),
                          "Initialize must reset the waitlist");

            const BookingResult reserved = engine.reserve(42, 3);
            result.expect(reserved.outcome == BookingOutcome::RESERVED && reserved.seatId == 1, "expected seat 1");
            const BookingResult cancelled = engine.cancel(1, 42);
            result.expect(cancelled.outcome == BookingOutcome::CANCELLED && cancelled.assignments.empty(),
                          "cancel without waiters must not reassign");
            result.expect(engine.available().availableSeats == 3, "seat did not return to the pool");
            result.expect(engine.reserve(43, 1).seatId == 1, "lowest seat not reused");
            TestValidator::checkInvariants(engine, result, "after round trip");

            const auto reservationsBefore = engine.reservations().allEntries();
            const BookingResult exited = engine.exitWaitlist(77);
            result.expect(exited.outcome == BookingOutcome::NOT_FOUND, "exit of absent user should be NOT_FOUND");
            result.expect(engine.reservations().allEntries().size() == reservationsBefore.size() &&
                          engine.seatPool().size() == 2 && engine.waitlist().isEmpty(),
                          "absent exit changed state");

            result.expect(engine.releaseSeats(9, 3).outcome == BookingOutcome::INVALID_ARGUMENT,
                          "inverted release range accepted");
            result.expect(engine.printReservations().assignments == std::vector<SeatAssignment>{{43, 1}},
                          "print should list user 43 on seat 1");
            result.operationsExecuted = 10;
            return result;
        }

        /**
         * Random command stream with every invariant checked after each step
         */
        inline TestResult orchestratorFuzz() {
            TestResult result{"Unit_OrchestratorFuzz"};
            BookingOrchestrator engine;
            std::mt19937 rng{12};
            std::uniform_int_distribution<int32_t> userDist{1, 40};
            std::uniform_int_distribution<int32_t> priorityDist{1, 5};
            std::uniform_int_distribution<int32_t> smallDist{1, 4};
            std::uniform_int_distribution<int> opDist{0, 9};

            engine.initialize(8);
            for (uint32_t step = 0; step < 600 && result.passed; ++step) {
                const int32_t user = userDist(rng);
                ++result.operationsExecuted;

                switch (opDist(rng)) {
                    case 0:
                    case 1:
                    case 2:
                        engine.reserve(user, priorityDist(rng));
                        break;
                    case 3:
                    case 4: {
                        const auto seat = engine.reservations().search(user);
                        engine.cancel(seat ? *seat : 1, user);
                        break;
                    }
                    case 5:
                        engine.exitWaitlist(user);
                        break;
                    case 6:
                        engine.updatePriority(user, priorityDist(rng));
                        break;
                    case 7:
                        engine.addSeats(smallDist(rng));
                        break;
                    case 8:
                        engine.releaseSeats(user, user + smallDist(rng));
                        break;
                    default:
                        engine.available();
                        break;
                }
                TestValidator::checkInvariants(engine, result, "fuzz step " + std::to_string(step));
            }
            return result;
        }

        inline std::vector<TestResult> runAll() {
            return {
                reservationIndexRandomOps(),
                reservationIndexAscendingInserts(),
                waitlistOrdering(),
                waitlistRandomOps(),
                seatPoolOrdering(),
                commandParsing(),
                orchestratorRoundTrips(),
                orchestratorFuzz(),
            };
        }
    }
}
