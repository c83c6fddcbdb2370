/** \file Export.hpp
 *  Symbol visibility macro for the QtPdfTemplate shared library.
 */
#pragma once
#include <QtCore/qglobal.h>

#if defined(QTPDFTEMPLATE_LIBRARY)
#  define QTPDFTEMPLATE_EXPORT Q_DECL_EXPORT
#else
#  define QTPDFTEMPLATE_EXPORT Q_DECL_IMPORT
#endif
