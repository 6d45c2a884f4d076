#include <types/PlainText.hpp>
#include <blockrunner.hpp>


PlainText::PlainText(std::string d) : data(d) {}

void PlainText::run(BlockRunner* runner) {
    runner -> emit(data);
}
