/** \file PdfStamp.hpp
 *  In-place rewrite of the time- and random-dependent fields QPdfWriter emits, so identical input yields identical bytes.
 */
#pragma once
#include <QByteArray>

namespace QtPdfTemplate::engine {

/** Fixed creation date written into every document, in PDF date digits (yyyyMMddHHmmss). */
constexpr char kFixedPdfDate[] = "20000101000000";
/** Same instant in ISO 8601, for the XMP packet. */
constexpr char kFixedIsoDate[] = "2000-01-01T00:00:00Z";

/** Rewrites every "(D:<14 digits>[+-hh'mm']" date and the hex strings of the trailer /ID array.
 *  Replacement text has the same length as the original so cross-reference offsets stay valid.
 *  idHex supplies the identifier digits (repeated as needed). Returns the number of fields rewritten. */
int stampDeterministicFields(QByteArray &pdf, const QByteArray &idHex);

} // namespace QtPdfTemplate::engine
