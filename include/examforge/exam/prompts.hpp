#pragma once

#include <examforge/exam/exam.hpp>

#include <string>

namespace examforge::prompts {

/// Where the dependency project is cloned, relative to the exam workspace root
constexpr const char* LIBRARY_SUBPATH = "repos/library";

constexpr const char* SCORE_LINE_FORMAT = "TOTAL USER SCORE: <score>/<total>";

/// Phase 1 of exam creation: explore, implement, write question/rubric and passing tests
std::string solution(const Topic& topic);

/// Phase 2 of exam creation: strip the implementation down to stubs, keep the tests
std::string problem();

std::string solve(const Exam& exam);

std::string evaluate(const Exam& exam);

} // namespace examforge::prompts
