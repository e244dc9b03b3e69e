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

#include <qtermdoc/QTermDocument.hpp>

struct QTermTextOptions {
    /* Pages sampled, from the start, for repeated headers and footers */
    int samplePages = 5;

    /* A line is furniture when it recurs on more than this share of the sampled pages */
    qreal furnitureRatio = 0.5;

    /* Spacing adjustment (thousandths of an em) below -threshold inserts a word space */
    qreal wordSpaceThreshold = 200.0;

    /* Downward pen movement (points) above which a new line starts */
    qreal lineTolerance = 2.0;

    /* Strip detected headers and footers */
    bool trimFurniture = true;
};

/* Lines recognised as page headers (top) and footers (bottom) */
struct QTermFurniture {
    QSet<QString> headers;
    QSet<QString> footers;

    bool isEmpty() const {
        return headers.isEmpty() and footers.isEmpty();
    }
};

struct QTermTextPage {
    enum Status {
        Ok,
        NoExtractableText
    };

    int     page       = -1;
    quint64 generation = 0;
    Status  status     = NoExtractableText;
    QString reason;

    /* Tokenized lines, before any structuring */
    QStringList rawLines;

    /* Reflowed paragraphs; an empty string marks a hard paragraph break */
    QStringList paragraphs;
};

class QTermTextEngine {
    public:
        enum TextMode {
            Raw,
            Wrap,
            Reflow
        };

        QTermTextEngine( QTermTextOptions opts = QTermTextOptions() );

        QTermTextOptions options() const;
        void setOptions( QTermTextOptions opts );

        /* Forget everything we know; @doc is not owned */
        void setDocument( QTermDocument *doc );

        /* Drop pages structured for an older generation */
        void invalidate();

        /** Structured text of @page for the current document generation. Cached, thread-safe. */
        QTermTextPage textPage( int page );

        bool isCached( int page ) const;

        /** Positioned draw operations to lines */
        static QStringList tokenize( const QTermTextOps& ops, const QTermTextOptions& opts );

        /** Look for lines repeated at the top or the bottom of the sample pages */
        static QTermFurniture detectFurniture( const QList<QStringList>& samples, const QTermTextOptions& opts );

        static QStringList stripFurniture( QStringList lines, const QTermFurniture& furniture );

        /** Join broken lines into paragraphs, undoing end-of-line hyphenation */
        static QStringList reflow( const QStringList& lines );

        /** Word-wrap one paragraph to @width cells */
        static QStringList wrap( const QString& text, int width );

        /** Wrap each paragraph; hard breaks become empty lines */
        static QStringList wrapParagraphs( const QStringList& paragraphs, int width );

        /** Wrap each line on its own, leaving preformatted lines untouched */
        static QStringList wrapLines( const QStringList& lines, int width );

        /** Lines to display for @page in @mode at @width cells */
        static QStringList layout( const QTermTextPage& page, TextMode mode, int width );

        /** Number of terminal cells @str occupies */
        static int displayWidth( const QString& str );

        static QString modeName( TextMode mode );
        static TextMode modeFromName( QString name, TextMode fallback );

    private:
        QStringList rawLines( int page );
        QTermFurniture furniture();

        mutable QMutex mLock;

        QTermTextOptions mOpts;
        QTermDocument *mDoc;
        quint64 mGeneration;

        QHash<int, QStringList> mRawLines;
        QHash<int, QTermTextPage> mPages;

        bool mFurnitureReady;
        QTermFurniture mFurniture;
};
