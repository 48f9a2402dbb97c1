/**
 * SPDX-License-Identifier: GPL-2.0-only
 *
 * This file is part of timebanner.
 *
 * Copyright (C) 2024 by the timebanner developer community.
 * For a full list of authors see the git log.
 */

#include "timebanner/svg_writer.hpp"

#include <fmt/core.h>

namespace timebanner {

namespace {

// called by libxml2, so this must not throw. -1 reports a failure.
int write_to_buffer(void *context, const char *buffer, int len) noexcept {
  auto *out = static_cast<output_buffer *>(context);
  if (out == nullptr)
    return -1;
  return out->write(buffer, len);
}

// libxml2 reports the failure through the return codes as well, so there's
// no need for it to print anything.
void ignore_generic_error(void *, const char *, ...) {}

const xmlChar *as_xml(const char *s) {
  return reinterpret_cast<const xmlChar *>(s);
}

} // anonymous namespace

svg_writer::svg_writer(output_buffer &out) {
  // no close callback: the response buffer is closed by whoever owns it
  xmlOutputBufferPtr xml_out = xmlOutputBufferCreateIO(write_to_buffer, nullptr, &out, nullptr);
  if (xml_out == nullptr)
    throw write_error("error creating SVG output buffer.");

  xmlSetGenericErrorFunc(xml_out->context, &ignore_generic_error);

  writer = xmlNewTextWriter(xml_out);
  if (writer == nullptr) {
    xmlOutputBufferClose(xml_out);
    throw write_error("error creating SVG writer.");
  }

  xmlTextWriterSetIndent(writer, 1);
  xmlTextWriterSetIndentString(writer, as_xml("  "));

  if (xmlTextWriterStartDocument(writer, nullptr, "UTF-8", nullptr) < 0) {
    xmlFreeTextWriter(writer);
    throw write_error("error starting SVG document.");
  }
}

svg_writer::~svg_writer() noexcept {
  xmlFreeTextWriter(writer);
}

void svg_writer::start(const char *name) {
  if (xmlTextWriterStartElement(writer, as_xml(name)) < 0)
    throw write_error(fmt::format("cannot start element {}.", name));
}

void svg_writer::attribute(const char *name, const std::string &value) {
  attribute(name, value.c_str());
}

void svg_writer::attribute(const char *name, const char *value) {
  if (xmlTextWriterWriteAttribute(writer, as_xml(name), as_xml(value)) < 0)
    throw write_error(fmt::format("cannot write attribute {}.", name));
}

void svg_writer::text(const std::string &t) {
  if (xmlTextWriterWriteString(writer, as_xml(t.c_str())) < 0)
    throw write_error("cannot write text.");
}

void svg_writer::end() {
  if (xmlTextWriterEndElement(writer) < 0)
    throw write_error("cannot end element.");
}

void svg_writer::finish() {
  if (xmlTextWriterEndDocument(writer) < 0)
    throw write_error("cannot finish SVG document.");
}

} // namespace timebanner
