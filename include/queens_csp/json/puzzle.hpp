/**
 * @file puzzle.hpp
 * @brief パズル JSON の読み込みと解の JSON 出力
 */
#ifndef QUEENS_CSP_JSON_PUZZLE_HPP
#define QUEENS_CSP_JSON_PUZZLE_HPP

#include "queens_csp/grid.hpp"
#include <string>
#include <vector>

namespace queens_csp {
namespace json {

/**
 * @brief パズル JSON ファイルをパース
 *
 * 形式: {"rows": R, "cols": C, "colors": [...], "idxToColor": [...]}
 * 未知のメンバーは読み飛ばす。
 *
 * @param filename ファイル名
 * @return パースされたパズル（GridSpec による検証は未実施）
 * @throws std::runtime_error ファイルが開けない、構文エラー、必須メンバー欠落、負の値
 */
Puzzle parse_file(const std::string& filename);

/**
 * @brief パズル JSON 文字列をパース
 * @param input 入力文字列
 * @return パースされたパズル
 * @throws std::runtime_error パースエラー時
 */
Puzzle parse_string(const std::string& input);

/**
 * @brief 解を JSON 配列に変換（例: "[0,7,14]"、解なしは "[]"）
 */
std::string to_json(const std::vector<size_t>& solution);

} // namespace json
} // namespace queens_csp

#endif // QUEENS_CSP_JSON_PUZZLE_HPP
