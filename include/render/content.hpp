// A block of template held as a value: the body of a t-call (the "0" slot) or of a content t-set.
// Output directives hand it to the render stack, which renders it in place. Anything that needs it as text (string operations,
// truthiness) renders it on the spot with a nested stack and keeps the result.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <render/callparams.hpp>
#include <memory>
#include <string>


struct ContentValue : LazyContent {
    Session* session;
    std::shared_ptr<CallParameters> params;
    std::string rendered;
    bool done = false;

    ContentValue(Session* s, std::shared_ptr<CallParameters> p);

    std::string html();

    std::string describe() const;
};
