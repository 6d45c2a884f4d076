// t-field and widget output: turning a record field (or any value) into markup plus attributes for the surrounding tag.
#pragma once
#include <defs.h>
#include <evals/value.hpp>
#include <options.hpp>
#include <string>


struct FieldResult {
    Mapping attributes; // merged into the element's attributes, after its own
    Value content; // None to fall back on the element's default content
    bool forceDisplay = false; // render the tag even when there is no content
};


struct FieldConverter {
    virtual ~FieldConverter() {}

    // record.field: record is whatever the expression before the last dot gave, tagName the element carrying t-field
    virtual FieldResult field(const Value& record, const std::string& fieldName, const std::string& expression, const std::string& tagName, const Mapping& fieldOptions, const RenderOptions& options) = 0;

    // t-out with a widget option
    virtual FieldResult widget(const Value& value, const std::string& expression, const std::string& tagName, const Mapping& fieldOptions, const RenderOptions& options) = 0;
};


struct DefaultFieldConverter : FieldConverter { // records are dicts; widgets: float, monetary, integer, text, html, contact
    FieldResult field(const Value& record, const std::string& fieldName, const std::string& expression, const std::string& tagName, const Mapping& fieldOptions, const RenderOptions& options);

    FieldResult widget(const Value& value, const std::string& expression, const std::string& tagName, const Mapping& fieldOptions, const RenderOptions& options);

    Value format(const Value& value, const std::string& widget, const Mapping& fieldOptions); // the content for one widget
};
