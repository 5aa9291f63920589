#pragma once

#include <array>

/*
 * Bit order encoding for a board of size n:
 *
 *  0       1       2     ...  n-1
 *  n       n+1     n+2   ...  2n-1
 *  ...
 *  (n-1)n  ...                n*n-1
 *
 * Cell (x, y) lives at bit y*n + x, so x is the column (east is +x) and y is the row (south is +y).
 *
 * For human-readable notation purposes, columns are lettered from 'a' and rows are numbered from 1:
 *
 * a1 b1 c1 ...
 * a2 b2 c2 ...
 * ...
 */
namespace othello {

const int kNumPlayers = 2;
const int kMaxBoardDimension = 12;
const int kMaxNumCells = kMaxBoardDimension * kMaxBoardDimension;

// Number of 64-bit words needed to hold kMaxNumCells bits.
const int kNumMaskWords = (kMaxNumCells + 63) / 64;

constexpr std::array<int, 4> kLegalBoardSizes = {6, 8, 10, 12};

const char kBlackGlyph = 'X';
const char kWhiteGlyph = 'O';
const char kEmptyGlyph = '_';
constexpr const char* kPossibleMoveGlyph = "·";
constexpr const char* kPassStr = "-1-1";

}  // namespace othello
