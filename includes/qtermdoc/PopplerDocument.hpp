/**
 * This file is a part of qtermdoc Project.
 * qtermdoc renders document pages inside a terminal
 * Copyright 2021-2022 Britanicus <marcusbritanicus@gmail.com>
 *
 * This program is free software; you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation; either version 2 of the License, or
 * at your option, any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program; if not, write to the Free Software
 * Foundation, Inc., 51 Franklin Street, Fifth Floor, Boston,
 * MA 02110-1301, USA.
 **/

#pragma once

#include <QtCore>
#include <QtGui>

#include <qtermdoc/QTermDocument.hpp>
#include <qtermdoc/QTermRenderOptions.hpp>

#include <memory>

#if QT_VERSION < QT_VERSION_CHECK( 6, 0, 0 )
#include <poppler-qt5.h>
#else
#include <poppler-qt6.h>
#endif

class PopplerDocument : public QTermDocument {
    Q_OBJECT;

    public:
        PopplerDocument( QString pdfPath );
        ~PopplerDocument();

        /* Set a password */
        void setPassword( QString password );

    public Q_SLOTS:
        void load();
        void close();

    private:
        void preparePages();

        /* Pointer to our actual pdf document */
        std::unique_ptr<Poppler::Document> mPdfDoc;

        /* Poppler is not reentrant for a single document: one call at a time */
        mutable QMutex mDocLock;
};

class PdfPage : public QTermPage {
    public:
        PdfPage( int, QMutex * );
        ~PdfPage();

        /* Way to store Poppler::Page */
        void setPageData( void *data );

        /* Size of the page */
        QSizeF pageSize( qreal zoom = 1.0 ) const;

        /* Render and return a page */
        QImage render( QSize, QTermRenderOptions ) const;

        /* Word boxes converted to positioned draw operations */
        QTermTextOps textOps() const;

    private:
        std::unique_ptr<Poppler::Page> m_page;
        QMutex *mDocLock;
};
