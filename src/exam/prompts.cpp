#include <examforge/exam/prompts.hpp>

#include <examforge/exam/exam.hpp>

#include <fmt/format.h>

#include <string>

namespace examforge::prompts {

std::string solution(const Topic& topic) {
    return fmt::format(
        "You are an expert Rust developer and exam creator.\n"
        "Your Task: Create a coding exam based on the topic: '{0}'\n"
        "Description: {1}\n\n"
        "Instructions:\n"
        "1. Explore the codebase to understand the context.\n"
        "2. Create a new feature or fix a bug related to the topic.\n"
        "3. Create a `question.md` file describing the problem clearly to a student.\n"
        "4. Create a `rubric.md` file with evaluation criteria.\n"
        "5. Implement the FULL solution code.\n"
        "6. Add a test file (e.g., `tests/exam_test.rs`) that verifies the solution. "
        "The tests MUST PASS with your solution.\n\n"
        "IMPORTANT: The library code is available in `{2}`.\n"
        "You MUST use this library for your solution (e.g. by adding it to Cargo.toml as a path dependency).\n"
        "You can refer to it but DO NOT modify any files in `{2}`.",
        topic.title, topic.description, LIBRARY_SUBPATH);
}

std::string problem() {
    return "You are now preparing the problem state for the student.\n"
           "Your Task: Reduce the solution code to a starting state.\n\n"
           "Instructions:\n"
           "1. Remove the implementation details of the feature/fix you just created, "
           "leaving only function signatures/struct definitions (stubs).\n"
           "2. Ensure the test file (`tests/exam_test.rs`) REMAINS but fails "
           "(compiles but asserts fail, or 'todo!()').\n"
           "3. DO NOT modify `question.md` or `rubric.md`. They must stay as is.\n"
           "4. Remove any other temporary files if you created them.";
}

std::string solve(const Exam& exam) {
    return fmt::format("You are taking a coding exam.\n\n"
                       "Question:\n{}\n\n"
                       "Please solve the problem by editing the files in the current directory.\n"
                       "Your solution must pass all provided tests (e.g. `cargo test`).\n",
                       exam.question);
}

std::string evaluate(const Exam& exam) {
    return fmt::format("You are a strict exam grader.\n\n"
                       "Your Task: Evaluate the student's solution in the current directory against the provided "
                       "rubric.\n\n"
                       "Question:\n{}\n\n"
                       "Rubric:\n{}\n\n"
                       "Instructions:\n"
                       "1. Run the tests (e.g. `cargo test`) to ensure correctness.\n"
                       "2. Inspect the code to check for specific requirements, code style, and potential cheating.\n"
                       "3. Provide a detailed report with points awarded for each rubric item.\n"
                       "4. Conclude with a '{}' line.\n",
                       exam.question, exam.rubric, SCORE_LINE_FORMAT);
}

} // namespace examforge::prompts
