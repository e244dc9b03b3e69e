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

#include <qtermdoc/QTermDocument.hpp>
#include <qtermdoc/QTermPageCache.hpp>
#include <qtermdoc/QTermRenderOptions.hpp>
#include <qtermdoc/QTermTextEngine.hpp>

/**
 * Rasterizes one cache key on a worker thread.
 * The bitmap goes through the cache, so two tasks for the same key
 * never rasterize twice.
 */
class RenderTask : public QObject, public QRunnable {
    Q_OBJECT;

    public:
        RenderTask( QTermDocument *doc, QTermPageCache *cache, QTermCacheKey key, QTermRenderOptions opts );

        QTermCacheKey key() const;

        void run();

        /* The work itself, shared with the synchronous path */
        static QTermCachedBitmap render( QTermDocument *doc, QTermPageCache *cache, QTermCacheKey key, QTermRenderOptions opts );

    private:
        QTermDocument *mDoc;
        QTermPageCache *mCache;
        QTermCacheKey mKey;
        QTermRenderOptions mOpts;

    Q_SIGNALS:
        void imageReady( QTermCacheKey key, QImage image, qint64 elapsedMs );
};

/**
 * Structures the text of one page on a worker thread.
 */
class TextTask : public QObject, public QRunnable {
    Q_OBJECT;

    public:
        TextTask( QTermTextEngine *engine, int page, quint64 generation );

        void run();

    private:
        QTermTextEngine *mEngine;
        int mPage;
        quint64 mGeneration;

    Q_SIGNALS:
        void textReady( int page, quint64 generation );
};
