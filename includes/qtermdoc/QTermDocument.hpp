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
#include <QtGui/QImage>

#include <qtermdoc/QTermRenderOptions.hpp>

class QTermPage;
class QFileSystemWatcher;

typedef QVector<QTermPage *> QTermPages;

/**
 * One positioned text-draw operation of a page, in drawing order.
 * @translation is the pen movement (points, y grows downwards) applied
 * before @text is drawn. @spacing is the explicit adjustment between
 * this fragment and the previous one, in thousandths of an em; negative
 * values move the pen to the right, i.e. open a visual gap.
 */
struct QTermTextOp {
    QString text;
    QPointF translation;
    bool    newline = false;
    qreal   spacing = 0.0;
};

typedef QVector<QTermTextOp> QTermTextOps;

/*
 * Generic class to handle a document
 * Subclasses open the file in load(), fill mPages and report the outcome
 * through mStatus/mError. Every successful (re)load bumps the generation.
 */
class QTermDocument : public QObject {
    Q_OBJECT;

    public:
        enum Status {
            Null,
            Loading,
            Ready,
            Unloading,
            Failed
        };
        Q_ENUM( Status );

        enum Error {
            NoError,
            FileNotFoundError,
            InvalidFileFormatError,
            IncorrectPasswordError,
            UnknownError
        };
        Q_ENUM( Error );

        QTermDocument( QString path );
        virtual ~QTermDocument();

        /* Absolute path of the document */
        QString documentPath() const;

        bool passwordNeeded() const;
        virtual void setPassword( QString ) = 0;

        int pageCount() const;

        /* Intrinsic page size, in points */
        QSizeF pageSize( int pageNo ) const;

        Status status() const;
        Error error() const;

        /* Monotonic counter, incremented on every successful (re)load */
        quint64 generation() const;

        /* Watch the file and reload when it changes on disk */
        void setWatchFile( bool );

        /* Rasterize @pageNo at exactly @size pixels. Null image on failure. */
        QImage renderPage( int pageNo, QSize size, QTermRenderOptions opts ) const;

        /* Positioned text-draw operations of @pageNo */
        QTermTextOps pageTextOps( int pageNo ) const;

    public Q_SLOTS:
        virtual void load()  = 0;
        virtual void close() = 0;

        void reload();

    protected:
        QString mDocPath;
        bool mPassNeeded;

        Status mStatus;
        Error mError;

        QTermPages mPages;

        /* Called by subclasses once the pages are ready */
        void bumpGeneration();

    private:
        quint64 mGeneration;
        QFileSystemWatcher *fsw;

    Q_SIGNALS:
        void pageCountChanged( int );
        void statusChanged( QTermDocument::Status );

        void documentReloading();
        void documentReloaded();
};

/*
 * Generic class to handle a document page
 */
class QTermPage {
    public:
        QTermPage( int pgNo );
        virtual ~QTermPage();

        int pageNo();

        /* Way to store the backend page */
        virtual void setPageData( void *data ) = 0;

        /* Size of the page, in points */
        virtual QSizeF pageSize( qreal zoom = 1.0 ) const = 0;

        /* Render the page at exactly @size pixels, RGBA8888 */
        virtual QImage render( QSize size, QTermRenderOptions ) const = 0;

        /* Positioned text-draw operations, in drawing order */
        virtual QTermTextOps textOps() const = 0;

    protected:
        int mPageNo;
};

/* Largest edge the rasterizer accepts, in pixels */
#define QTERMDOC_MAX_RENDER_EDGE 16384
