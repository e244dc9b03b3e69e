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

#include <functional>

/**
 * Everything needed to reproduce a bitmap from an open document.
 * Two equal requests rasterize to identical pixels.
 */
struct QTermRenderRequest {
    int page   = -1;
    int width  = 0;
    int height = 0;
    QTermRenderOptions::ColorMode colorMode = QTermRenderOptions::Color;

    bool isValid() const {
        return page >= 0 and width > 0 and height > 0;
    }
};

inline bool operator==( const QTermRenderRequest& lhs, const QTermRenderRequest& rhs ) {
    return lhs.page == rhs.page and lhs.width == rhs.width and lhs.height == rhs.height and lhs.colorMode == rhs.colorMode;
}


inline bool operator!=( const QTermRenderRequest& lhs, const QTermRenderRequest& rhs ) {
    return !operator==( lhs, rhs );
}


struct QTermCacheKey {
    quint64 generation = 0;
    QTermRenderRequest request;
};

inline bool operator==( const QTermCacheKey& lhs, const QTermCacheKey& rhs ) {
    return lhs.generation == rhs.generation and lhs.request == rhs.request;
}


inline bool operator!=( const QTermCacheKey& lhs, const QTermCacheKey& rhs ) {
    return !operator==( lhs, rhs );
}


inline uint qHash( const QTermCacheKey& key, uint seed = 0 ) {
    uint h = ::qHash( key.generation, seed );

    h = h * 31 + ::qHash( key.request.page, seed );
    h = h * 31 + ::qHash( key.request.width, seed );
    h = h * 31 + ::qHash( key.request.height, seed );
    h = h * 31 + ::qHash( (int)key.request.colorMode, seed );

    return h;
}


Q_DECLARE_METATYPE( QTermCacheKey );


/**
 * A bitmap held by the cache. The image is handed out as a read-only,
 * implicitly shared view: the cache may drop its own reference on the
 * next insert, so callers use it for one frame and let it go.
 */
struct QTermCachedBitmap {
    QTermCacheKey key;
    QImage        pixels;
    qint64        lastUsedAt = 0;

    int width() const {
        return pixels.width();
    }

    int height() const {
        return pixels.height();
    }

    bool isNull() const {
        return pixels.isNull();
    }
};

class QTermPageCache {
    public:
        typedef std::function<QImage()> Producer;

        explicit QTermPageCache( int capacity = 4 );
        ~QTermPageCache();

        int capacity() const;
        void setCapacity( int );

        int count() const;
        bool contains( const QTermCacheKey& key ) const;

        /**
         * Return the bitmap for @key, running @producer to create it on a miss.
         * Concurrent callers asking for the same key while the producer runs
         * wait for that one result instead of producing it again.
         * A null image from the producer is not cached; every waiter gets the
         * null bitmap and a later call tries again.
         */
        QTermCachedBitmap getOrInsert( const QTermCacheKey& key, Producer producer );

        /** Return the bitmap for @key if present (touching it), or a null bitmap */
        QTermCachedBitmap lookup( const QTermCacheKey& key );

        /** Drop every entry that does not belong to @generation */
        void invalidateBefore( quint64 generation );

        void clear();

        /** Number of producer invocations so far */
        qint64 productions() const;

    private:
        struct Pending {
            bool   done = false;
            QImage pixels;
        };

        void insert( const QTermCacheKey& key, QImage img );
        void evictIfNeeded();

        mutable QMutex mLock;
        QWaitCondition mProduced;

        QHash<QTermCacheKey, QTermCachedBitmap> mEntries;
        QHash<QTermCacheKey, QSharedPointer<Pending> > mInFlight;

        int mCapacity;
        qint64 mClock;
        qint64 mProductions;
};
