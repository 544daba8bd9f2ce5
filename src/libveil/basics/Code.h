#pragma once

#include <xrpl/basics/Expected.h>

#include <string>

namespace veil {

/** Reason a pool, market or registry operation was refused.

    Every failure aborts the whole operation; the code tells the caller
    which check tripped.
*/
enum class Code : int {
    // Validation
    emptyCommitment = 100,
    duplicateCommitment,
    invalidOutcome,
    badProofShape,
    emptyQuestion,
    unknownLeaf,

    // State
    notOpen = 200,
    notRevealing,
    notResolving,
    notResolved,
    badDeadlines,
    disputeWindowClosed,
    disputeNotAllowed,
    unknownBet,
    alreadyRevealed,
    notRevealed,
    alreadyClaimed,
    notWinner,

    // Authorization
    notCreator = 300,
    notOracle,
    notOwner,
    notAuthorized,

    // Integrity
    commitmentMismatch = 400,
    rootMismatch,
    nullifierMismatch,
    betCommitmentMismatch,
    marketIdMismatch,
    outcomeMismatch,
    nullifierUsed,
    treeFull,

    // External dependency
    transferFailed = 500,
    proofRejected,
    feedUnavailable,
};

enum class Category { validation, state, authorization, integrity, external };

Category
categoryOf(Code code);

/** Short identifier for a code, e.g. "nullifierUsed". */
std::string
transToken(Code code);

/** Human readable description of a code. */
std::string
transHuman(Code code);

std::string
to_string(Category category);

template <class T>
using Expected = ripple::Expected<T, Code>;

using ripple::Unexpected;

}  // namespace veil
